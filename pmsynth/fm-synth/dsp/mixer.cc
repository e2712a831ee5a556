/**
 * @file mixer.cc
 * @brief Stereo output stage implementation
 */

#include "mixer.h"

#include <cstring>

#ifdef DEBUG
#include <cstdio>
#endif

namespace dsp {

Mixer::Mixer()
    : num_channels_(0)
    , mix_gain_(0.0f)
    , generation_(0)
    , built_(false)
{
    memset(channels_, 0, sizeof(channels_));
    memset(mono_, 0, sizeof(mono_));
}

float Mixer::PanPosition(uint8_t idx, uint8_t polyphony) {
    if (polyphony <= 1) {
        return 0.0f;
    }
    return 2.0f * static_cast<float>(idx) / static_cast<float>(polyphony - 1) - 1.0f;
}

void Mixer::Rebuild(VoiceAllocator& voices) {
    num_channels_ = voices.polyphony();
    mix_gain_ = num_channels_ > 0 ? 1.0f / static_cast<float>(num_channels_) : 0.0f;

    for (uint8_t i = 0; i < num_channels_; ++i) {
        Channel& ch = channels_[i];
        ch.voice = &voices.GetVoiceMutable(i);
        ch.pan = PanPosition(i, num_channels_);
        ch.left_gain = (1.0f - ch.pan) * 0.5f * mix_gain_;
        ch.right_gain = (1.0f + ch.pan) * 0.5f * mix_gain_;
    }

    generation_ = voices.generation();
    built_ = true;

#ifdef DEBUG
    fprintf(stderr, "[Mixer] Rebuilt: voices=%d generation=%u\n",
            num_channels_, generation_);
    fflush(stderr);
#endif
}

void Mixer::Render(VoiceAllocator& voices, float* out, uint32_t frames) {
    if (!built_ || generation_ != voices.generation()) {
        Rebuild(voices);
    }

    memset(out, 0, frames * 2 * sizeof(float));

    while (frames > 0) {
        const uint32_t block = frames < kBlockSize ? frames : kBlockSize;

        for (uint8_t v = 0; v < num_channels_; ++v) {
            const Channel& ch = channels_[v];
            ch.voice->Render(mono_, block);

            float* dst = out;
            for (uint32_t i = 0; i < block; ++i) {
                dst[0] += mono_[i] * ch.left_gain;
                dst[1] += mono_[i] * ch.right_gain;
                dst += 2;
            }
        }

        out += block * 2;
        frames -= block;
    }
}

}  // namespace dsp

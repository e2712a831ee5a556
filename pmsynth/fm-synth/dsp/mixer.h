/**
 * @file mixer.h
 * @brief Stereo output stage for the voice pool
 *
 * Pulls mono blocks from every voice, pans them to fixed positions spread
 * evenly across the stereo field and sums them with a 1/polyphony gain.
 */

#pragma once

#include <cstdint>
#include "fm_voice.h"
#include "voice_allocator.h"

namespace dsp {

class Mixer {
public:
    Mixer();

    /**
     * @brief Render interleaved stereo
     * @param voices Voice pool to pull from
     * @param out Output buffer, 2 * frames samples
     * @param frames Number of frames, any size
     *
     * If the pool was reset since the last call the per-voice chain is
     * rebuilt first; the full request is still rendered.
     */
    void Render(VoiceAllocator& voices, float* out, uint32_t frames);

    uint32_t generation() const { return generation_; }
    bool built() const { return built_; }
    float mix_gain() const { return mix_gain_; }
    float pan(uint8_t idx) const { return channels_[idx].pan; }

    // Pan position of voice idx out of polyphony voices, -1.0 to 1.0
    static float PanPosition(uint8_t idx, uint8_t polyphony);

private:
    struct Channel {
        FmVoice* voice;
        float pan;
        float left_gain;
        float right_gain;
    };

    Channel channels_[VoiceAllocator::kMaxVoices];
    uint8_t num_channels_;
    float mix_gain_;
    uint32_t generation_;
    bool built_;

    float mono_[kBlockSize];

    void Rebuild(VoiceAllocator& voices);
};

}  // namespace dsp

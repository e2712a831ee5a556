/**
 * @file fm_voice.cc
 * @brief Four-operator phase modulation voice implementation
 */

#include "fm_voice.h"
#include "../../common/dsp_utils.h"

#include <cstring>

namespace dsp {

FmVoice::FmVoice()
    : feedback_(0.0f)
    , algorithm_(0)
    , has_last_pitch_(false)
    , last_pitch_(0.0f)
{
    for (uint8_t n = 0; n < kNumOperators; ++n) {
        detune_[n] = 1.0f;
    }
}

void FmVoice::Init(const FmPatch& patch, const WaveBank& waves, float sample_rate) {
    for (uint8_t n = 0; n < kNumOperators; ++n) {
        const FmOperatorPatch& p = patch.ops[n];
        ops_[n].Init(&waves.Get(p.wave), sample_rate, p.env, p.volume);
        detune_[n] = p.detune;
    }
    feedback_ = patch.feedback;
    algorithm_ = patch.algorithm;
    Reset();
}

void FmVoice::NoteOn(float pitch_hz, float velocity) {
    has_last_pitch_ = true;
    last_pitch_ = pitch_hz;
    for (uint8_t n = 0; n < kNumOperators; ++n) {
        ops_[n].NoteOn(pitch_hz * detune_[n], velocity);
    }
}

void FmVoice::NoteOff(float pitch_hz, float velocity) {
    if (!has_last_pitch_ || last_pitch_ != pitch_hz) {
        return;  // Stale note-off for a note this voice no longer plays
    }
    for (uint8_t n = 0; n < kNumOperators; ++n) {
        ops_[n].NoteOff(pitch_hz * detune_[n], velocity);
    }
    has_last_pitch_ = false;
}

void FmVoice::SetPitchRatio(float ratio) {
    for (uint8_t n = 0; n < kNumOperators; ++n) {
        ops_[n].SetPitchRatio(ratio);
    }
}

void FmVoice::Render(float* out, uint32_t frames) {
    while (frames > 0) {
        const uint32_t block = frames < kBlockSize ? frames : kBlockSize;
        RenderBlock(out, block);
        out += block;
        frames -= block;
    }
}

void FmVoice::RenderBlock(float* out, uint32_t frames) {
    const FmAlgorithm& algorithm = GetAlgorithm(algorithm_);

    memset(out, 0, frames * sizeof(float));

    // Operator 4 down to operator 1: modulators are always rendered first
    for (int n = kNumOperators - 1; n >= 0; --n) {
        const uint8_t sources = algorithm.modulators[n];

        memset(mod_, 0, frames * sizeof(float));
        for (uint8_t m = n + 1; m < kNumOperators; ++m) {
            if ((sources >> m) & 1) {
                const float* src = op_out_[m];
                for (uint32_t i = 0; i < frames; ++i) {
                    mod_[i] += src[i];
                }
            }
        }

        float* dst = op_out_[n];
        ops_[n].Render(mod_, dst, frames);

        if (n == kNumOperators - 1 && feedback_ != 0.0f) {
            for (uint32_t i = 0; i < frames; ++i) {
                dst[i] = saturatef(dst[i] + feedback_ * dst[i]);
            }
        }

        if (IsCarrier(algorithm, n)) {
            for (uint32_t i = 0; i < frames; ++i) {
                out[i] += dst[i];
            }
        }
    }

    for (uint32_t i = 0; i < frames; ++i) {
        out[i] = saturatef(out[i]);
    }
}

void FmVoice::Reset() {
    for (uint8_t n = 0; n < kNumOperators; ++n) {
        ops_[n].Reset();
    }
    has_last_pitch_ = false;
    last_pitch_ = 0.0f;
}

bool FmVoice::IsSilent() const {
    return CarriersMatch(&FmOperator::IsSilent);
}

bool FmVoice::IsReleased() const {
    return CarriersMatch(&FmOperator::IsReleased);
}

// Audibility only depends on the operators the algorithm sends to the output
bool FmVoice::CarriersMatch(bool (FmOperator::*predicate)() const) const {
    const FmAlgorithm& algorithm = GetAlgorithm(algorithm_);
    for (uint8_t n = 0; n < kNumOperators; ++n) {
        if (IsCarrier(algorithm, n) && !(ops_[n].*predicate)()) {
            return false;
        }
    }
    return true;
}

}  // namespace dsp

/**
 * @file fm_operator.cc
 * @brief Phase-modulated wavetable operator implementation
 */

#include "fm_operator.h"
#include "../../common/dsp_utils.h"

#include <cstring>

namespace dsp {

static constexpr float kTableSize = static_cast<float>(WaveTable::kSize);

FmOperator::FmOperator()
    : wave_(nullptr)
    , envelope_()
    , sample_rate_(48000.0f)
    , pitch_hz_(440.0f)
    , pitch_ratio_(1.0f)
    , velocity_(0.0f)
    , volume_(1.0f)
    , phase_(0.0f)
    , phase_increment_(0.0f)
    , pending_reset_(false)
{
}

void FmOperator::Init(const WaveTable* wave, float sample_rate,
                      const FmEnvelope::Params& env, float volume) {
    wave_ = wave;
    sample_rate_ = sample_rate;
    volume_ = volume;
    envelope_.Init(env);
    Reset();
}

void FmOperator::NoteOn(float pitch_hz, float velocity) {
    pitch_hz_ = pitch_hz;
    velocity_ = velocity;
    pending_reset_ = true;
    UpdateIncrement();
}

void FmOperator::NoteOff(float /*pitch_hz*/, float /*velocity*/) {
    if (pending_reset_) {
        // The note started and ended between two render calls
        envelope_.NoteOn();
        pending_reset_ = false;
    }
    envelope_.NoteOff();
}

void FmOperator::SetPitchRatio(float ratio) {
    pitch_ratio_ = ratio;
    UpdateIncrement();
}

void FmOperator::Render(const float* modulation, float* out, uint32_t frames) {
    if (pending_reset_) {
        envelope_.NoteOn();
        pending_reset_ = false;
    }

    if (envelope_.IsSilent() || wave_ == nullptr) {
        // Idle operators keep their phase
        memset(out, 0, frames * sizeof(float));
        return;
    }

    const float gain = velocity_ * volume_;
    float phase = phase_;
    for (uint32_t i = 0; i < frames; ++i) {
        const float index = wrapf(phase + modulation[i] * kTableSize, kTableSize);
        out[i] = wave_->Read(index) * envelope_.Advance() * gain;

        phase += phase_increment_;
        if (phase >= kTableSize) {
            phase = wrapf(phase, kTableSize);
        }
    }
    phase_ = phase;
}

void FmOperator::Reset() {
    envelope_.Reset();
    pitch_ratio_ = 1.0f;
    velocity_ = 0.0f;
    phase_ = 0.0f;
    pending_reset_ = false;
    UpdateIncrement();
}

void FmOperator::UpdateIncrement() {
    phase_increment_ = kTableSize * pitch_hz_ * pitch_ratio_ / sample_rate_;
}

}  // namespace dsp

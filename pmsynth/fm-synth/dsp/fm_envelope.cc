/**
 * @file fm_envelope.cc
 * @brief Linear ADSR envelope implementation
 */

#include "fm_envelope.h"
#include "../../common/dsp_utils.h"

#ifdef DEBUG
#include <cstdio>
#endif

namespace dsp {

FmEnvelope::FmEnvelope()
    : params_{0, 0, 1.0f, 0}
    , state_(STATE_IDLE)
    , level_(0.0f)
    , start_level_(0.0f)
    , samples_in_stage_(0)
{
}

void FmEnvelope::Init(const Params& params) {
    params_ = params;
    params_.sustain = clampf(params.sustain, 0.0f, 1.0f);
    Reset();
#ifdef DEBUG
    fprintf(stderr, "[Envelope] Init: A=%u D=%u S=%.3f R=%u samples\n",
            params_.attack, params_.decay, params_.sustain, params_.release);
    fflush(stderr);
#endif
}

void FmEnvelope::NoteOn() {
    state_ = STATE_ATTACK;
    samples_in_stage_ = 0;
    // Don't reset level_ - retrigger ramps from the current position
    start_level_ = level_;
}

void FmEnvelope::NoteOff() {
    state_ = STATE_RELEASE;
    samples_in_stage_ = 0;
    start_level_ = level_;
}

float FmEnvelope::Advance() {
    switch (state_) {
        case STATE_ATTACK:
            ++samples_in_stage_;
            if (samples_in_stage_ >= params_.attack) {
                level_ = 1.0f;
                state_ = STATE_DECAY;
                samples_in_stage_ = 0;
            } else {
                const float t = static_cast<float>(samples_in_stage_) / params_.attack;
                level_ = start_level_ + (1.0f - start_level_) * t;
            }
            break;

        case STATE_DECAY:
            ++samples_in_stage_;
            if (samples_in_stage_ >= params_.decay) {
                level_ = params_.sustain;
                state_ = STATE_SUSTAIN;
                samples_in_stage_ = 0;
            } else {
                const float t = static_cast<float>(samples_in_stage_) / params_.decay;
                level_ = 1.0f - (1.0f - params_.sustain) * t;
            }
            break;

        case STATE_SUSTAIN:
            level_ = params_.sustain;
            break;

        case STATE_RELEASE:
            ++samples_in_stage_;
            if (samples_in_stage_ >= params_.release) {
                level_ = 0.0f;
                state_ = STATE_IDLE;
                samples_in_stage_ = 0;
            } else {
                const float t = static_cast<float>(samples_in_stage_) / params_.release;
                level_ = start_level_ * (1.0f - t);
            }
            break;

        case STATE_IDLE:
        default:
            level_ = 0.0f;
            break;
    }

    return level_;
}

void FmEnvelope::Reset() {
    state_ = STATE_IDLE;
    level_ = 0.0f;
    start_level_ = 0.0f;
    samples_in_stage_ = 0;
}

} // namespace dsp

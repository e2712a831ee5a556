/**
 * @file fm_envelope.h
 * @brief Linear ADSR envelope generator for FM operators
 *
 * Piecewise-linear segments with times given in samples.
 * A zero-length segment is instantaneous.
 */

#pragma once

#include <cstdint>

namespace dsp {

/**
 * @brief Per-operator ADSR envelope
 *
 * Four-stage envelope: Attack, Decay, Sustain, Release.
 * Advanced exactly once per rendered sample.
 */
class FmEnvelope {
public:
    /**
     * @brief Envelope states
     */
    enum State {
        STATE_IDLE = 0,      // Not triggered
        STATE_ATTACK,        // Ramping up to 1.0
        STATE_DECAY,         // Ramping down to sustain level
        STATE_SUSTAIN,       // Holds at sustain level
        STATE_RELEASE        // Ramping down to 0.0
    };

    /**
     * @brief Envelope shape, times in samples
     */
    struct Params {
        uint32_t attack;
        uint32_t decay;
        float sustain;       // 0.0-1.0
        uint32_t release;
    };

    FmEnvelope();

    /**
     * @brief Set the shape and return to idle
     * @param params Segment lengths and sustain level
     */
    void Init(const Params& params);

    /**
     * @brief Enter the attack stage
     *
     * The current level is kept so a retrigger ramps up from wherever
     * the envelope is instead of clicking back to zero.
     */
    void NoteOn();

    /**
     * @brief Enter the release stage from the current level
     */
    void NoteOff();

    /**
     * @brief Process one sample
     * @return Envelope level 0.0-1.0
     */
    float Advance();

    /**
     * @brief Return to idle at level 0
     */
    void Reset();

    State GetState() const { return state_; }
    float level() const { return level_; }
    const Params& params() const { return params_; }

    bool IsSilent() const { return state_ == STATE_IDLE; }
    bool IsReleased() const { return state_ == STATE_RELEASE || state_ == STATE_IDLE; }

private:
    Params params_;
    State state_;
    float level_;
    float start_level_;          // Level when the current stage was entered
    uint32_t samples_in_stage_;
};

} // namespace dsp

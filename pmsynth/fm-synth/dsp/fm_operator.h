/**
 * @file fm_operator.h
 * @brief Phase-modulated wavetable operator
 *
 * One oscillator plus its envelope. The modulation input shifts the table
 * read position: a modulator sample of 1.0 moves the read head one full
 * cycle ahead.
 */

#pragma once

#include <cstdint>
#include "fm_envelope.h"
#include "wavetable.h"

namespace dsp {

class FmOperator {
public:
    FmOperator();

    /**
     * @brief Bind the operator to its table and envelope shape
     * @param wave Shared wavetable (borrowed, must outlive the operator)
     * @param sample_rate Sample rate in Hz
     * @param env Envelope shape
     * @param volume Relative attenuation 0.0-1.0
     */
    void Init(const WaveTable* wave, float sample_rate,
              const FmEnvelope::Params& env, float volume);

    /**
     * @brief Start a note; the envelope restarts at the next Render()
     */
    void NoteOn(float pitch_hz, float velocity);

    /**
     * @brief Release the envelope
     */
    void NoteOff(float pitch_hz, float velocity);

    /**
     * @brief Pitch bend ratio applied on top of the note pitch
     */
    void SetPitchRatio(float ratio);

    /**
     * @brief Render a block
     * @param modulation Phase modulation input, one value per frame
     * @param out Output buffer
     * @param frames Number of frames
     */
    void Render(const float* modulation, float* out, uint32_t frames);

    /**
     * @brief Return to the freshly initialized state
     */
    void Reset();

    bool IsSilent() const { return !pending_reset_ && envelope_.IsSilent(); }
    bool IsReleased() const { return !pending_reset_ && envelope_.IsReleased(); }

    float phase() const { return phase_; }
    float pitch_hz() const { return pitch_hz_; }
    float velocity() const { return velocity_; }
    float pitch_ratio() const { return pitch_ratio_; }
    bool pending_reset() const { return pending_reset_; }
    const FmEnvelope& envelope() const { return envelope_; }

private:
    const WaveTable* wave_;
    FmEnvelope envelope_;
    float sample_rate_;
    float pitch_hz_;
    float pitch_ratio_;
    float velocity_;
    float volume_;
    float phase_;                // Fractional index into the table
    float phase_increment_;      // Table samples per output sample
    bool pending_reset_;

    void UpdateIncrement();
};

}  // namespace dsp

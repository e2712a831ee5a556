/**
 * @file fm_voice.h
 * @brief Four-operator phase modulation voice
 */

#pragma once

#include <cstdint>
#include "fm_algorithm.h"
#include "fm_operator.h"
#include "fm_patch.h"
#include "wavetable.h"

namespace dsp {

// Frames rendered per inner block; all scratch buffers are this size
static constexpr uint32_t kBlockSize = 64;

/**
 * @brief One note's worth of FM synthesis
 *
 * Operators are wired by the patch's algorithm. A note-off only reaches the
 * operators when its pitch matches the last note-on, so a late note-off for
 * a note this voice has since been stolen from cannot cut the new note short.
 */
class FmVoice {
public:
    FmVoice();

    /**
     * @brief Configure operators from a patch
     * @param patch Sound parameters
     * @param waves Table bank the operators read from
     * @param sample_rate Sample rate in Hz
     */
    void Init(const FmPatch& patch, const WaveBank& waves, float sample_rate);

    void NoteOn(float pitch_hz, float velocity);
    void NoteOff(float pitch_hz, float velocity);
    void SetPitchRatio(float ratio);

    /**
     * @brief Render mono output
     * @param out Output buffer
     * @param frames Number of frames, any size
     */
    void Render(float* out, uint32_t frames);

    /**
     * @brief Back to the freshly initialized state, no note assigned
     */
    void Reset();

    bool IsSilent() const;
    bool IsReleased() const;

    bool has_last_pitch() const { return has_last_pitch_; }
    float last_pitch() const { return last_pitch_; }
    uint8_t algorithm() const { return algorithm_; }
    float feedback() const { return feedback_; }
    const FmOperator& op(uint8_t idx) const { return ops_[idx]; }

private:
    FmOperator ops_[kNumOperators];
    float detune_[kNumOperators];
    float feedback_;
    uint8_t algorithm_;
    bool has_last_pitch_;
    float last_pitch_;

    // Scratch
    float op_out_[kNumOperators][kBlockSize];
    float mod_[kBlockSize];

    void RenderBlock(float* out, uint32_t frames);
    bool CarriersMatch(bool (FmOperator::*predicate)() const) const;
};

}  // namespace dsp

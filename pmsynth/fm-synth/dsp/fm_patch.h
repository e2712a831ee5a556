/**
 * @file fm_patch.h
 * @brief Sound parameters for one 4-operator voice
 */

#pragma once

#include <cstdint>
#include "fm_algorithm.h"
#include "fm_envelope.h"

namespace dsp {

struct FmOperatorPatch {
    uint8_t wave;                // WaveTable::Shape
    float detune;                // Frequency ratio against the note pitch
    float volume;                // 0.0-1.0
    FmEnvelope::Params env;      // Times in samples
};

struct FmPatch {
    char name[14];
    uint8_t algorithm;           // 0..kNumAlgorithms-1
    float feedback;              // Self-gain on operator 4 before saturation
    FmOperatorPatch ops[kNumOperators];
};

}  // namespace dsp

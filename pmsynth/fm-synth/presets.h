/**
 * @file presets.h
 * @brief Factory patches for the FM synth
 *
 * Envelope times are in samples at 48kHz:
 * - Init: Single sine carrier, starting point for editing
 * - E.Piano: Two stacks, tine on top of a soft body
 * - Bell: Inharmonic ratios with a long ring-out
 * - Bass: Saw-driven stack, short and punchy
 * - Organ: Four drawbar-style carriers
 * - Brass: Feedback-driven modulator with a slow swell
 */

#pragma once

#include "../common/preset_manager.h"
#include "dsp/fm_patch.h"
#include "dsp/wavetable.h"

namespace presets {

using dsp::FmPatch;
using dsp::WaveTable;

static constexpr uint8_t kNumFactoryPatches = 6;

// Field order per operator: wave, detune, volume, {attack, decay, sustain, release}
static const FmPatch kFactoryPatches[kNumFactoryPatches] = {
    // Patch 0: Init
    {
        "Init", 0, 0.0f,
        {
            {WaveTable::SHAPE_SINE, 1.0f, 1.0f, {240, 9600, 0.7f, 9600}},
            {WaveTable::SHAPE_SINE, 1.0f, 0.0f, {0, 0, 1.0f, 0}},
            {WaveTable::SHAPE_SINE, 1.0f, 0.0f, {0, 0, 1.0f, 0}},
            {WaveTable::SHAPE_SINE, 1.0f, 0.0f, {0, 0, 1.0f, 0}},
        }
    },

    // Patch 1: E.Piano - algorithm 4 (4>3, 2>1), carriers 1 and 3
    {
        "E.Piano", 4, 0.0f,
        {
            {WaveTable::SHAPE_SINE, 1.0f, 0.8f, {48, 48000, 0.0f, 14400}},
            {WaveTable::SHAPE_SINE, 14.0f, 0.25f, {0, 9600, 0.0f, 4800}},
            {WaveTable::SHAPE_SINE, 1.0f, 0.6f, {48, 36000, 0.0f, 14400}},
            {WaveTable::SHAPE_SINE, 1.0f, 0.35f, {0, 24000, 0.1f, 9600}},
        }
    },

    // Patch 2: Bell - algorithm 2 (4>3>1, 4>2>1)
    {
        "Bell", 2, 0.0f,
        {
            {WaveTable::SHAPE_SINE, 1.0f, 1.0f, {0, 144000, 0.0f, 48000}},
            {WaveTable::SHAPE_SINE, 3.5f, 0.3f, {0, 96000, 0.0f, 48000}},
            {WaveTable::SHAPE_SINE, 1.41f, 0.4f, {0, 72000, 0.0f, 48000}},
            {WaveTable::SHAPE_SINE, 2.0f, 0.2f, {0, 48000, 0.0f, 24000}},
        }
    },

    // Patch 3: Bass - algorithm 0 (4>3>2>1)
    {
        "Bass", 0, 0.2f,
        {
            {WaveTable::SHAPE_SINE, 1.0f, 1.0f, {0, 14400, 0.6f, 2400}},
            {WaveTable::SHAPE_SINE, 1.0f, 0.3f, {0, 7200, 0.2f, 2400}},
            {WaveTable::SHAPE_SAW, 0.5f, 0.2f, {0, 4800, 0.0f, 2400}},
            {WaveTable::SHAPE_SINE, 2.0f, 0.1f, {0, 2400, 0.0f, 2400}},
        }
    },

    // Patch 4: Organ - algorithm 11, all carriers
    {
        "Organ", 11, 0.0f,
        {
            {WaveTable::SHAPE_SINE12, 1.0f, 0.5f, {96, 0, 1.0f, 480}},
            {WaveTable::SHAPE_SINE, 2.0f, 0.3f, {96, 0, 1.0f, 480}},
            {WaveTable::SHAPE_SINE, 0.5f, 0.4f, {96, 0, 1.0f, 480}},
            {WaveTable::SHAPE_SINE, 3.0f, 0.15f, {96, 0, 1.0f, 480}},
        }
    },

    // Patch 5: Brass - algorithm 1 (4>3>1, 2>1) with feedback on 4
    {
        "Brass", 1, 0.6f,
        {
            {WaveTable::SHAPE_SINE, 1.0f, 0.9f, {2400, 9600, 0.8f, 7200}},
            {WaveTable::SHAPE_SINE, 1.0f, 0.2f, {3600, 9600, 0.5f, 7200}},
            {WaveTable::SHAPE_SINE, 1.0f, 0.3f, {4800, 9600, 0.6f, 7200}},
            {WaveTable::SHAPE_PULSE, 1.0f, 0.1f, {4800, 14400, 0.4f, 7200}},
        }
    },
};

typedef common::PresetManager<FmPatch> PatchManager;

}  // namespace presets

/**
 * @file synth_options.h
 * @brief Command-line options shared by the host programs
 */

#pragma once

#include <cstdint>
#include "../fm-synth/fm_synth.h"

namespace host {

struct SynthOptions {
    int preset;
    const char* preset_name;  // Set when --preset was not a number
    int polyphony;
    int sample_rate;
    bool has_algorithm;
    int algorithm;
    bool has_feedback;
    float feedback;

    SynthOptions();
};

/**
 * @brief Consume one engine option at argv[*i]
 * @return True if the option was recognized; *i is left on its last argument
 */
bool ParseSynthOption(int argc, char** argv, int* i, SynthOptions* options);

/**
 * @brief Turn parsed options into an engine configuration
 * @return False (and logs) if the preset does not exist or an override is invalid
 */
bool BuildConfig(const SynthOptions& options, FmSynth::Config* config);

void PrintSynthOptionsUsage();

void PrintPresets();

}  // namespace host

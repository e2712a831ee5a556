/**
 * @file synth_options.cc
 * @brief Command-line options shared by the host programs
 */

#include "synth_options.h"
#include "../fm-synth/presets.h"

#include <cstdlib>
#include <cstring>
#include <iostream>

namespace host {

SynthOptions::SynthOptions()
    : preset(0)
    , preset_name(nullptr)
    , polyphony(kFmDefaultPolyphony)
    , sample_rate(static_cast<int>(kFmDefaultSampleRate))
    , has_algorithm(false)
    , algorithm(0)
    , has_feedback(false)
    , feedback(0.0f)
{
}

bool ParseSynthOption(int argc, char** argv, int* i, SynthOptions* options) {
    const char* arg = argv[*i];
    if (*i + 1 >= argc) {
        return false;
    }
    if (strcmp(arg, "--preset") == 0) {
        const char* value = argv[++*i];
        char* tail = nullptr;
        const long index = strtol(value, &tail, 10);
        if (*value != '\0' && *tail == '\0') {
            options->preset = static_cast<int>(index);
            options->preset_name = nullptr;
        } else {
            options->preset_name = value;
        }
    } else if (strcmp(arg, "--polyphony") == 0) {
        options->polyphony = atoi(argv[++*i]);
    } else if (strcmp(arg, "--rate") == 0) {
        options->sample_rate = atoi(argv[++*i]);
    } else if (strcmp(arg, "--algorithm") == 0) {
        options->algorithm = atoi(argv[++*i]);
        options->has_algorithm = true;
    } else if (strcmp(arg, "--feedback") == 0) {
        options->feedback = static_cast<float>(atof(argv[++*i]));
        options->has_feedback = true;
    } else {
        return false;
    }
    return true;
}

bool BuildConfig(const SynthOptions& options, FmSynth::Config* config) {
    presets::PatchManager bank(presets::kFactoryPatches, presets::kNumFactoryPatches);
    if (options.preset_name != nullptr) {
        if (!bank.SelectByName(options.preset_name)) {
            std::cerr << "Unknown preset \"" << options.preset_name
                      << "\" (see --list-presets)" << std::endl;
            return false;
        }
    } else if (options.preset < 0 || options.preset > 255 ||
               !bank.Select(static_cast<uint8_t>(options.preset))) {
        std::cerr << "Invalid preset " << options.preset << " (0-"
                  << (bank.size() - 1) << ")" << std::endl;
        return false;
    }

    if (options.has_algorithm && options.algorithm < 0) {
        std::cerr << "Invalid algorithm " << options.algorithm << " (0-"
                  << static_cast<int>(dsp::kNumAlgorithms - 1) << ")" << std::endl;
        return false;
    }
    if (options.has_algorithm) {
        // Ids past the table fall back to parallel routing in the engine
        bank.Edit().algorithm = static_cast<uint8_t>(options.algorithm > 255 ? 255 : options.algorithm);
    }
    if (options.has_feedback) {
        bank.Edit().feedback = options.feedback;
    }
#ifdef DEBUG
    if (bank.edited()) {
        std::cerr << "[Options] " << bank.current().name << " edited from the command line" << std::endl;
    }
#endif

    config->patch = bank.current();
    config->sample_rate = static_cast<float>(options.sample_rate);
    // Out-of-range values are left for FmSynth::Init to reject
    config->polyphony = static_cast<uint8_t>(
        options.polyphony < 0 ? 0 : (options.polyphony > 255 ? 255 : options.polyphony));
    return true;
}

void PrintSynthOptionsUsage() {
    std::cerr << "  --preset <n|name>    Factory patch by index or name (default 0, see --list-presets)\n";
    std::cerr << "  --polyphony <n>      Voices 1-" << static_cast<int>(dsp::VoiceAllocator::kMaxVoices)
              << " (default " << static_cast<int>(kFmDefaultPolyphony) << ")\n";
    std::cerr << "  --rate <hz>          Sample rate (default "
              << static_cast<int>(kFmDefaultSampleRate) << ")\n";
    std::cerr << "  --algorithm <n>      Override the patch algorithm 0-"
              << static_cast<int>(dsp::kNumAlgorithms - 1) << "\n";
    std::cerr << "  --feedback <f>       Override operator 4 feedback\n";
    std::cerr << "  --list-presets       Print the factory patches and exit\n";
}

void PrintPresets() {
    presets::PatchManager bank(presets::kFactoryPatches, presets::kNumFactoryPatches);
    for (uint8_t i = 0; i < bank.size(); ++i) {
        std::cout << "  " << static_cast<int>(i) << ": " << bank.NameAt(i)
                  << " (algorithm " << static_cast<int>(bank.PatchAt(i).algorithm)
                  << ")" << std::endl;
    }
}

}  // namespace host

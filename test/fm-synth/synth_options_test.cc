#include <cstdio>
#include <cstring>
#include "fm-synth/presets.h"
#include "host/synth_options.h"

int main() {
  char prog[] = "fm-render";
  char preset_flag[] = "--preset";
  char preset_val[] = "2";
  char alg_flag[] = "--algorithm";
  char alg_val[] = "7";
  char fb_flag[] = "--feedback";
  char fb_val[] = "0.25";
  char poly_flag[] = "--polyphony";
  char poly_val[] = "6";
  char other[] = "--out";
  char* argv[] = {prog, preset_flag, preset_val, alg_flag, alg_val,
                  fb_flag, fb_val, poly_flag, poly_val, other};
  const int argc = sizeof(argv) / sizeof(argv[0]);

  host::SynthOptions options;
  int recognized = 0;
  for (int i = 1; i < argc; ++i) {
    if (host::ParseSynthOption(argc, argv, &i, &options)) {
      recognized++;
    }
  }
  if (recognized != 4 || options.preset != 2 || options.algorithm != 7 ||
      !options.has_feedback || options.feedback != 0.25f || options.polyphony != 6) {
    std::fprintf(stderr, "FAIL: option parsing\n");
    return 1;
  }

  FmSynth::Config config;
  if (!host::BuildConfig(options, &config)) {
    std::fprintf(stderr, "FAIL: valid options rejected\n");
    return 1;
  }
  if (strcmp(config.patch.name, presets::kFactoryPatches[2].name) != 0 ||
      config.patch.algorithm != 7 || config.patch.feedback != 0.25f ||
      config.polyphony != 6) {
    std::fprintf(stderr, "FAIL: overrides not applied\n");
    return 1;
  }

  // The factory table itself is untouched by overrides
  if (presets::kFactoryPatches[2].algorithm == 7) {
    std::fprintf(stderr, "FAIL: factory patch modified\n");
    return 1;
  }

  options.preset = presets::kNumFactoryPatches;
  if (host::BuildConfig(options, &config)) {
    std::fprintf(stderr, "FAIL: out-of-range preset accepted\n");
    return 1;
  }

  // Presets by name, case-insensitive
  char name_val[] = "BELL";
  char* by_name[] = {prog, preset_flag, name_val};
  host::SynthOptions named;
  int j = 1;
  if (!host::ParseSynthOption(3, by_name, &j, &named) || j != 2 ||
      !host::BuildConfig(named, &config) ||
      strcmp(config.patch.name, "Bell") != 0) {
    std::fprintf(stderr, "FAIL: preset by name\n");
    return 1;
  }
  char bad_name[] = "Theremin";
  by_name[2] = bad_name;
  j = 1;
  if (!host::ParseSynthOption(3, by_name, &j, &named) || host::BuildConfig(named, &config)) {
    std::fprintf(stderr, "FAIL: unknown preset name accepted\n");
    return 1;
  }

  // Editing the working patch leaves the bank alone
  presets::PatchManager bank(presets::kFactoryPatches, presets::kNumFactoryPatches);
  if (!bank.SelectByName("organ") || bank.edited()) {
    std::fprintf(stderr, "FAIL: select by name\n");
    return 1;
  }
  bank.Edit().feedback = 0.9f;
  if (!bank.edited() || bank.PatchAt(bank.index()).feedback == 0.9f ||
      !bank.Select(bank.index()) || bank.edited() ||
      bank.current().feedback != bank.PatchAt(bank.index()).feedback) {
    std::fprintf(stderr, "FAIL: working patch edits\n");
    return 1;
  }

  // Negative algorithm ids are refused, large ones reach the engine
  char neg_val[] = "-5";
  char* neg_args[] = {prog, alg_flag, neg_val};
  host::SynthOptions negative;
  int k = 1;
  if (!host::ParseSynthOption(3, neg_args, &k, &negative) || !negative.has_algorithm ||
      host::BuildConfig(negative, &config)) {
    std::fprintf(stderr, "FAIL: negative algorithm accepted\n");
    return 1;
  }
  negative.algorithm = 40;
  if (!host::BuildConfig(negative, &config) || config.patch.algorithm != 40) {
    std::fprintf(stderr, "FAIL: out-of-table algorithm not passed through\n");
    return 1;
  }
  host::SynthOptions untouched;
  if (!host::BuildConfig(untouched, &config) ||
      config.patch.algorithm != presets::kFactoryPatches[0].algorithm) {
    std::fprintf(stderr, "FAIL: algorithm changed without --algorithm\n");
    return 1;
  }

  // Out-of-range polyphony is left for the engine to reject
  options.preset = 0;
  options.polyphony = 40;
  FmSynth synth;
  if (!host::BuildConfig(options, &config) || synth.Init(config) != kFmErrPolyphony) {
    std::fprintf(stderr, "FAIL: polyphony 40 not rejected by the engine\n");
    return 1;
  }

  std::printf("synth options tests passed\n");
  return 0;
}

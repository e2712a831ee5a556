// fm-render: offline renderer
// Plays a chord through the engine and writes the result to a WAV file

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "../fm-synth/fm_synth.h"
#include "status_monitor.h"
#include "synth_options.h"
#include "wav_file.h"

// Buffer sizes cycled through while rendering, like a driver that
// does not deliver fixed-size callbacks
static const uint32_t kBlockPattern[] = {128, 37, 64, 256, 1, 100};
static const size_t kBlockPatternLen = sizeof(kBlockPattern) / sizeof(kBlockPattern[0]);

static void PrintUsage(const char* prog) {
  std::cerr << "Usage: " << prog << " --out <file> [options]\n";
  std::cerr << "Options:\n";
  std::cerr << "  --notes <n,n,...>    MIDI notes (default 60,64,67)\n";
  std::cerr << "  --velocity <vel>     MIDI velocity 1-127 (default 100)\n";
  std::cerr << "  --hold-ms <ms>       Note-off time in ms (default 1000)\n";
  std::cerr << "  --seconds <sec>      Render length in seconds (default 2.0)\n";
  std::cerr << "  --s16                Write 16-bit PCM instead of 32-bit float\n";
  host::PrintSynthOptionsUsage();
}

static bool ParseNotes(const char* text, std::vector<uint8_t>* notes) {
  notes->clear();
  std::string list(text);
  size_t start = 0;
  while (start <= list.size()) {
    size_t end = list.find(',', start);
    if (end == std::string::npos) {
      end = list.size();
    }
    const std::string item = list.substr(start, end - start);
    if (item.empty()) {
      return false;
    }
    char* tail = nullptr;
    const long note = strtol(item.c_str(), &tail, 10);
    if (*tail != '\0' || note < 0 || note > 127) {
      return false;
    }
    notes->push_back(static_cast<uint8_t>(note));
    start = end + 1;
  }
  return !notes->empty();
}

int main(int argc, char** argv) {
  host::SynthOptions options;
  std::string out_path;
  std::vector<uint8_t> notes;
  notes.push_back(60);
  notes.push_back(64);
  notes.push_back(67);
  int velocity = 100;
  int hold_ms = 1000;
  float seconds = 2.0f;
  bool s16 = false;

  for (int i = 1; i < argc; ++i) {
    if (host::ParseSynthOption(argc, argv, &i, &options)) {
      continue;
    }
    if (strcmp(argv[i], "--out") == 0 && i + 1 < argc) {
      out_path = argv[++i];
    } else if (strcmp(argv[i], "--notes") == 0 && i + 1 < argc) {
      if (!ParseNotes(argv[++i], &notes)) {
        std::cerr << "Invalid note list: " << argv[i] << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "--velocity") == 0 && i + 1 < argc) {
      velocity = atoi(argv[++i]);
    } else if (strcmp(argv[i], "--hold-ms") == 0 && i + 1 < argc) {
      hold_ms = atoi(argv[++i]);
    } else if (strcmp(argv[i], "--seconds") == 0 && i + 1 < argc) {
      seconds = static_cast<float>(atof(argv[++i]));
    } else if (strcmp(argv[i], "--s16") == 0) {
      s16 = true;
    } else if (strcmp(argv[i], "--list-presets") == 0) {
      host::PrintPresets();
      return 0;
    } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
      PrintUsage(argv[0]);
      return 0;
    } else {
      std::cerr << "Unknown option: " << argv[i] << std::endl;
      PrintUsage(argv[0]);
      return 1;
    }
  }

  if (out_path.empty()) {
    PrintUsage(argv[0]);
    return 1;
  }
  if (velocity < 1 || velocity > 127) {
    std::cerr << "Invalid velocity " << velocity << " (1-127)" << std::endl;
    return 1;
  }
  if (!(seconds > 0.0f) || hold_ms < 0) {
    std::cerr << "Invalid timing: --seconds must be > 0, --hold-ms >= 0" << std::endl;
    return 1;
  }

  FmSynth::Config config;
  if (!host::BuildConfig(options, &config)) {
    return 1;
  }

  static FmSynth synth;
  const int8_t status = synth.Init(config);
  if (status != kFmErrNone) {
    std::cerr << "Failed to initialize synth (error " << static_cast<int>(status) << ")" << std::endl;
    return 1;
  }

  const uint32_t sample_rate = static_cast<uint32_t>(config.sample_rate);
  const uint32_t total_frames = static_cast<uint32_t>(seconds * config.sample_rate);
  const uint64_t note_off_frame = static_cast<uint64_t>(hold_ms) * sample_rate / 1000;

  host::WavFile wav;
  if (!wav.Create(out_path, static_cast<int>(sample_rate), 2,
                  s16 ? host::WavFile::FORMAT_PCM16 : host::WavFile::FORMAT_FLOAT32,
                  config.patch.name)) {
    return 1;
  }

  std::vector<float> block_f(256 * 2, 0.0f);
  std::vector<int16_t> block_s(256 * 2, 0);

  for (size_t n = 0; n < notes.size(); ++n) {
    if (!synth.NoteOn(notes[n], static_cast<uint8_t>(velocity))) {
      std::cerr << "Event queue full, note " << static_cast<int>(notes[n]) << " dropped" << std::endl;
    }
  }

  uint32_t frame = 0;
  size_t pattern_pos = 0;
  bool note_off_sent = false;

  while (frame < total_frames) {
    if (!note_off_sent && frame >= note_off_frame) {
      for (size_t n = 0; n < notes.size(); ++n) {
        if (!synth.NoteOff(notes[n], 0)) {
          std::cerr << "Event queue full, note-off " << static_cast<int>(notes[n])
                    << " dropped" << std::endl;
        }
      }
      note_off_sent = true;
    }

    uint32_t frames_this_block = kBlockPattern[pattern_pos];
    pattern_pos = (pattern_pos + 1) % kBlockPatternLen;
    if (frames_this_block > total_frames - frame) {
      frames_this_block = total_frames - frame;
    }
    // Do not run past the note-off point
    if (!note_off_sent && frame + frames_this_block > note_off_frame) {
      frames_this_block = static_cast<uint32_t>(note_off_frame - frame);
    }

    sf_count_t written;
    if (s16) {
      synth.Render(block_s.data(), frames_this_block);
      written = wav.Append(block_s.data(), frames_this_block);
    } else {
      synth.Render(block_f.data(), frames_this_block);
      written = wav.Append(block_f.data(), frames_this_block);
    }
    if (written != static_cast<sf_count_t>(frames_this_block)) {
      return 1;
    }

    frame += frames_this_block;
  }

  if (!wav.Close()) {
    return 1;
  }

  host::RuntimeCounters counters;
  counters.render_faults = synth.fault_count();
  counters.dropped_events = synth.dropped_events();
  host::StatusMonitor monitor;
  monitor.Report(counters, std::cerr);
  std::cout << "Wrote " << out_path << " (" << static_cast<long long>(wav.frames_written()) << " frames, "
            << config.patch.name << ")" << std::endl;
  return 0;
}

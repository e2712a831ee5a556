// fm-synth: real-time FM synthesizer
// MIDI in through RtMidi, stereo audio out through PortAudio

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

#include "../fm-synth/fm_synth.h"
#include "audio_engine.h"
#include "midi_decoder.h"
#include "midi_input.h"
#include "status_monitor.h"
#include "synth_options.h"

static std::atomic<bool> g_running(true);

static void HandleSignal(int) {
  g_running = false;
}

static void PrintUsage(const char* prog) {
  std::cerr << "Usage: " << prog << " --port <name> [options]\n";
  std::cerr << "Options:\n";
  std::cerr << "  --port <name>        MIDI input port (substring match)\n";
  std::cerr << "  --virtual            Create a virtual MIDI port named by --port\n";
  std::cerr << "  --channel <ch>       MIDI channel 1-16 (default 1)\n";
  std::cerr << "  --frames <n>         Frames per buffer, 0 = driver default (max "
            << host::kMaxFramesPerBuffer << ")\n";
  std::cerr << "  --device <n>         PortAudio output device (default: system default)\n";
  std::cerr << "  --s16                16-bit integer output instead of float\n";
  std::cerr << "  --list-ports         Print MIDI input ports and audio devices and exit\n";
  host::PrintSynthOptionsUsage();
}

int main(int argc, char** argv) {
  host::SynthOptions options;
  std::string port_name;
  bool virtual_port = false;
  int channel = 1;
  int frames = 0;
  int device = -1;
  bool s16 = false;

  for (int i = 1; i < argc; ++i) {
    if (host::ParseSynthOption(argc, argv, &i, &options)) {
      continue;
    }
    if (strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
      port_name = argv[++i];
    } else if (strcmp(argv[i], "--virtual") == 0) {
      virtual_port = true;
    } else if (strcmp(argv[i], "--channel") == 0 && i + 1 < argc) {
      channel = atoi(argv[++i]);
    } else if (strcmp(argv[i], "--frames") == 0 && i + 1 < argc) {
      frames = atoi(argv[++i]);
    } else if (strcmp(argv[i], "--device") == 0 && i + 1 < argc) {
      device = atoi(argv[++i]);
    } else if (strcmp(argv[i], "--s16") == 0) {
      s16 = true;
    } else if (strcmp(argv[i], "--list-ports") == 0) {
      std::cout << "MIDI inputs:" << std::endl;
      for (const std::string& name : host::MidiInput::ListPorts()) {
        std::cout << "  " << name << std::endl;
      }
      std::cout << "Audio outputs:" << std::endl;
      host::AudioEngine::ListDevices();
      return 0;
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

  if (port_name.empty()) {
    PrintUsage(argv[0]);
    return 1;
  }
  if (channel < 1 || channel > 16) {
    std::cerr << "Invalid MIDI channel " << channel << " (1-16)" << std::endl;
    return 1;
  }
  if (frames < 0 || frames > static_cast<int>(host::kMaxFramesPerBuffer)) {
    std::cerr << "Invalid buffer size " << frames << " (0-"
              << host::kMaxFramesPerBuffer << ")" << std::endl;
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
  std::cout << "Patch: " << config.patch.name << ", algorithm "
            << static_cast<int>(config.patch.algorithm) << ", "
            << static_cast<int>(config.polyphony) << " voices" << std::endl;

  host::MidiDecoder decoder(&synth, static_cast<uint8_t>(channel));
  host::MidiInput midi(&decoder);
  const bool midi_ok = virtual_port ? midi.OpenVirtual(port_name) : midi.Open(port_name);
  if (!midi_ok) {
    return 1;
  }

  host::audio_config_t audio_cfg;
  audio_cfg.sample_rate = static_cast<uint32_t>(config.sample_rate);
  audio_cfg.frames_per_buffer = static_cast<uint16_t>(frames);
  audio_cfg.int16_output = s16;
  audio_cfg.device = device;

  host::AudioEngine audio(audio_cfg, &synth);
  if (!audio.Start()) {
    midi.Close();
    return 1;
  }

  signal(SIGINT, HandleSignal);
  signal(SIGTERM, HandleSignal);
  std::cout << "Running, Ctrl-C to quit" << std::endl;

  host::StatusMonitor monitor;
  while (g_running) {
    std::this_thread::sleep_for(std::chrono::seconds(1));

    host::RuntimeCounters counters;
    counters.render_faults = synth.fault_count();
    counters.dropped_events = synth.dropped_events();
    counters.underruns = audio.buffer_underruns();
    counters.callback_errors = audio.callback_errors();
    counters.oversized_buffers = audio.oversized_buffers();
    counters.cpu_load = audio.CpuLoad();
    monitor.Report(counters, std::cerr);
  }

  std::cout << std::endl << "Stopping" << std::endl;
  midi.Close();
  audio.Stop();
  return 0;
}

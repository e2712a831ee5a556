#pragma once

#include <stdint.h>
#include <atomic>

#include <portaudio.h>

#include "status_monitor.h"

class FmSynth;

namespace host {

typedef struct {
    uint32_t sample_rate;         // e.g., 48000
    uint16_t frames_per_buffer;   // 0 lets the driver choose
    bool int16_output;            // paInt16 instead of paFloat32
    int device;                   // -1 for the default output device
} audio_config_t;

// Stereo PortAudio output stream pulling from an FmSynth.
class AudioEngine {
public:
    AudioEngine(const audio_config_t& cfg, FmSynth* synth);
    ~AudioEngine();

    // Returns false and logs on any PortAudio error
    bool Start();
    void Stop();

    bool running() const { return stream_ != nullptr; }

    // Returns PortAudio stream CPU load (0..1), or -1 if not running
    float CpuLoad() const;

    // Callbacks that threw and were replaced by silence
    uint32_t callback_errors() const { return callback_errors_.load(std::memory_order_relaxed); }

    // Count of output underflows reported by the driver
    uint32_t buffer_underruns() const { return buffer_underruns_.load(std::memory_order_relaxed); }

    // Callbacks asking for more than kMaxFramesPerBuffer; still rendered
    uint32_t oversized_buffers() const { return oversized_buffers_.load(std::memory_order_relaxed); }

    static void ListDevices();

private:
    audio_config_t cfg_;
    FmSynth* synth_;
    PaStream* stream_;
    bool pa_initialized_;

    std::atomic<uint32_t> callback_errors_;
    std::atomic<uint32_t> buffer_underruns_;
    std::atomic<uint32_t> oversized_buffers_;

    static int Callback(const void* input, void* output,
                        unsigned long frames,
                        const PaStreamCallbackTimeInfo* time_info,
                        PaStreamCallbackFlags status_flags,
                        void* user_data);
    int Process(void* output, unsigned long frames, PaStreamCallbackFlags status_flags);
    void WriteSilence(void* output, unsigned long frames) const;

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;
};

}  // namespace host

#include "audio_engine.h"
#include "../fm-synth/fm_synth.h"

#include <cstring>
#include <exception>
#include <iostream>

namespace host {

static void PrintPaError(const char* what, PaError err) {
    std::cerr << "[Audio] " << what << ": " << Pa_GetErrorText(err) << std::endl;
}

AudioEngine::AudioEngine(const audio_config_t& cfg, FmSynth* synth)
    : cfg_(cfg)
    , synth_(synth)
    , stream_(nullptr)
    , pa_initialized_(false)
    , callback_errors_(0)
    , buffer_underruns_(0)
    , oversized_buffers_(0)
{
    if (cfg_.frames_per_buffer > kMaxFramesPerBuffer) {
        cfg_.frames_per_buffer = kMaxFramesPerBuffer;
    }
}

AudioEngine::~AudioEngine() {
    Stop();
}

bool AudioEngine::Start() {
    if (stream_) {
        return true;
    }

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        PrintPaError("Pa_Initialize failed", err);
        return false;
    }
    pa_initialized_ = true;

    PaStreamParameters out_params;
    memset(&out_params, 0, sizeof(out_params));
    out_params.device = cfg_.device >= 0 ? cfg_.device : Pa_GetDefaultOutputDevice();
    if (out_params.device == paNoDevice || out_params.device >= Pa_GetDeviceCount()) {
        std::cerr << "[Audio] No usable output device" << std::endl;
        Stop();
        return false;
    }
    const PaDeviceInfo* info = Pa_GetDeviceInfo(out_params.device);
    out_params.channelCount = 2;
    out_params.sampleFormat = cfg_.int16_output ? paInt16 : paFloat32;
    out_params.suggestedLatency = info ? info->defaultLowOutputLatency : 0.0;
    out_params.hostApiSpecificStreamInfo = nullptr;

    const unsigned long frames_per_buffer = cfg_.frames_per_buffer > 0
        ? cfg_.frames_per_buffer
        : paFramesPerBufferUnspecified;

    err = Pa_OpenStream(&stream_, nullptr, &out_params,
                        static_cast<double>(cfg_.sample_rate),
                        frames_per_buffer, paClipOff,
                        &AudioEngine::Callback, this);
    if (err != paNoError) {
        PrintPaError("Pa_OpenStream failed", err);
        stream_ = nullptr;
        Stop();
        return false;
    }

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        PrintPaError("Pa_StartStream failed", err);
        Stop();
        return false;
    }

    std::cout << "[Audio] Output: " << (info ? info->name : "?")
              << " @ " << cfg_.sample_rate << " Hz, "
              << (cfg_.int16_output ? "int16" : "float32") << std::endl;
    return true;
}

void AudioEngine::Stop() {
    if (stream_) {
        PaError err = Pa_StopStream(stream_);
        if (err != paNoError) {
            PrintPaError("Pa_StopStream failed", err);
        }
        err = Pa_CloseStream(stream_);
        if (err != paNoError) {
            PrintPaError("Pa_CloseStream failed", err);
        }
        stream_ = nullptr;
    }
    if (pa_initialized_) {
        const PaError err = Pa_Terminate();
        if (err != paNoError) {
            PrintPaError("Pa_Terminate failed", err);
        }
        pa_initialized_ = false;
    }
}

float AudioEngine::CpuLoad() const {
    if (!stream_) {
        return -1.0f;
    }
    return static_cast<float>(Pa_GetStreamCpuLoad(stream_));
}

void AudioEngine::ListDevices() {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        PrintPaError("Pa_Initialize failed", err);
        return;
    }
    const PaDeviceIndex count = Pa_GetDeviceCount();
    for (PaDeviceIndex i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && info->maxOutputChannels >= 2) {
            std::cout << "  " << i << ": " << info->name
                      << " (" << info->defaultSampleRate << " Hz)" << std::endl;
        }
    }
    err = Pa_Terminate();
    if (err != paNoError) {
        PrintPaError("Pa_Terminate failed", err);
    }
}

int AudioEngine::Callback(const void* input, void* output,
                          unsigned long frames,
                          const PaStreamCallbackTimeInfo* time_info,
                          PaStreamCallbackFlags status_flags,
                          void* user_data) {
    (void)input;
    (void)time_info;
    return static_cast<AudioEngine*>(user_data)->Process(output, frames, status_flags);
}

int AudioEngine::Process(void* output, unsigned long frames, PaStreamCallbackFlags status_flags) {
    if (status_flags & paOutputUnderflow) {
        buffer_underruns_.fetch_add(1, std::memory_order_relaxed);
    }
    // The engine renders any block size; oversized blocks are only counted
    if (frames > kMaxFramesPerBuffer) {
        oversized_buffers_.fetch_add(1, std::memory_order_relaxed);
    }

    try {
        if (cfg_.int16_output) {
            synth_->Render(static_cast<int16_t*>(output), static_cast<uint32_t>(frames));
        } else {
            synth_->Render(static_cast<float*>(output), static_cast<uint32_t>(frames));
        }
    } catch (const std::exception&) {
        // Never let an exception unwind into the driver
        WriteSilence(output, frames);
        callback_errors_.fetch_add(1, std::memory_order_relaxed);
    }
    return paContinue;
}

void AudioEngine::WriteSilence(void* output, unsigned long frames) const {
    const size_t sample_size = cfg_.int16_output ? sizeof(int16_t) : sizeof(float);
    memset(output, 0, frames * 2 * sample_size);
}

}  // namespace host

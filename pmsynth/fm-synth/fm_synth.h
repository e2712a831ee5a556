/**
 * @file fm_synth.h
 * @brief Polyphonic 4-operator FM synthesizer engine
 *
 * The only object a host talks to. Control calls (MIDI input thread) are
 * packed into events and handed to the render path through a lock-free
 * queue; the render path applies them at the top of each Render() call,
 * then pulls stereo audio from the voice pool.
 *
 * Threading:
 *  - Init() must not run concurrently with anything else.
 *  - NoteOn/NoteOff/ControlChange/PitchBend/AllNotesOff: one producer thread.
 *  - Render(): one consumer thread (the audio driver).
 */

#pragma once

#include <atomic>
#include <cstdint>

#include "../common/midi_sink.h"
#include "../common/ring_buffer.h"
#include "dsp/fm_patch.h"
#include "dsp/fm_voice.h"
#include "dsp/mixer.h"
#include "dsp/voice_allocator.h"
#include "dsp/wavetable.h"

// Init() status codes
static constexpr int8_t kFmErrNone = 0;
static constexpr int8_t kFmErrPolyphony = -1;
static constexpr int8_t kFmErrSampleRate = -2;
static constexpr int8_t kFmErrPatch = -3;

static constexpr uint8_t kFmDefaultPolyphony = 10;
static constexpr float kFmDefaultSampleRate = 48000.0f;

// Event queue depth between the control path and the render path
static constexpr uint32_t kEventQueueSize = 256;

class FmSynth : public common::MidiSink {
public:
    struct Config {
        float sample_rate;
        uint8_t polyphony;
        dsp::FmPatch patch;

        Config();
    };

    enum EventType {
        EVENT_NOTE_ON = 0,
        EVENT_NOTE_OFF,
        EVENT_SUSTAIN,
        EVENT_PITCH_BEND,
        EVENT_ALL_NOTES_OFF
    };

    struct SynthEvent {
        uint8_t type;       // EventType
        uint8_t note;
        uint8_t value;      // Velocity or controller value
        uint16_t value14;   // Pitch bend
    };

    FmSynth();
    ~FmSynth() override {}

    /**
     * @brief Validate the configuration and build the engine
     * @return kFmErrNone on success; the engine renders silence otherwise
     */
    int8_t Init(const Config& config);

    // Control path. Return false if the event queue was full.
    // AllNotesOff() is queued like the rest; it takes effect at the next Render().
    bool NoteOn(uint8_t note, uint8_t velocity) override;
    bool NoteOff(uint8_t note, uint8_t velocity) override;
    bool ControlChange(uint8_t controller, uint8_t value) override;
    bool PitchBend(uint16_t value) override;
    bool ModWheel(uint16_t value) override;
    bool Expression(uint16_t value) override;
    bool AllNotesOff() override;
    bool HandlesController(uint8_t controller) const override;

    /**
     * @brief Render interleaved stereo audio
     * @param out Output buffer, 2 * frames samples
     * @param frames Number of frames, any size
     */
    void Render(float* out, uint32_t frames);
    void Render(int16_t* out, uint32_t frames);

    bool initialized() const { return initialized_; }
    const Config& config() const { return config_; }

    // Blocks replaced by silence because they contained NaN or Inf
    uint32_t fault_count() const { return fault_count_.load(std::memory_order_relaxed); }
    uint32_t dropped_events() const { return dropped_events_.load(std::memory_order_relaxed); }
    uint32_t pending_events() const { return events_.Size(); }

    // Render-thread state, for inspection between Render() calls
    const dsp::VoiceAllocator& allocator() const { return allocator_; }
    const dsp::Mixer& mixer() const { return mixer_; }

private:
    Config config_;
    bool initialized_;

    dsp::WaveBank waves_;
    dsp::VoiceAllocator allocator_;
    dsp::Mixer mixer_;

    common::RingBuffer<SynthEvent, kEventQueueSize> events_;
    std::atomic<uint32_t> fault_count_;
    std::atomic<uint32_t> dropped_events_;

    // int16 conversion scratch
    float scratch_[dsp::kBlockSize * 2];

    static int8_t ValidatePatch(const dsp::FmPatch& patch);

    bool Push(uint8_t type, uint8_t note, uint8_t value, uint16_t value14);
    void DrainEvents();
    void ApplyEvent(const SynthEvent& event);
    void RenderChecked(float* out, uint32_t frames);

    // Prevent copying
    FmSynth(const FmSynth&) = delete;
    FmSynth& operator=(const FmSynth&) = delete;
};

/**
 * @file fm_synth.cc
 * @brief FM synthesizer engine implementation
 */

#include "fm_synth.h"
#include "presets.h"
#include "../common/dsp_utils.h"
#include "../common/midi_helper.h"

#include <cstring>

#ifdef DEBUG
#include <cstdio>
#endif

// Upper bound for a usable output rate
static constexpr float kMaxSampleRate = 384000.0f;

// Highest operator frequency ratio a patch may ask for
static constexpr float kMaxDetune = 64.0f;

FmSynth::Config::Config()
    : sample_rate(kFmDefaultSampleRate)
    , polyphony(kFmDefaultPolyphony)
    , patch(presets::kFactoryPatches[0])
{
}

FmSynth::FmSynth()
    : config_()
    , initialized_(false)
    , fault_count_(0)
    , dropped_events_(0)
{
    memset(scratch_, 0, sizeof(scratch_));
}

int8_t FmSynth::Init(const Config& config) {
    initialized_ = false;

    if (!(config.sample_rate > 0.0f && config.sample_rate <= kMaxSampleRate)) {
        return kFmErrSampleRate;
    }
    if (config.polyphony < 1 || config.polyphony > dsp::VoiceAllocator::kMaxVoices) {
        return kFmErrPolyphony;
    }
    const int8_t patch_status = ValidatePatch(config.patch);
    if (patch_status != kFmErrNone) {
        return patch_status;
    }

    config_ = config;

    // Build the note table now so the render thread never does
    common::MidiHelper::InitTables();

    waves_.Init();
    if (!allocator_.Init(config_.polyphony, config_.patch, waves_, config_.sample_rate)) {
        return kFmErrPolyphony;
    }

    SynthEvent discard;
    while (events_.Pop(&discard)) {
    }
    fault_count_.store(0, std::memory_order_relaxed);
    dropped_events_.store(0, std::memory_order_relaxed);

#ifdef DEBUG
    fprintf(stderr, "[FmSynth] Init: rate=%.0f polyphony=%d patch=%s algorithm=%d\n",
            config_.sample_rate, config_.polyphony, config_.patch.name,
            config_.patch.algorithm);
    fflush(stderr);
#endif

    initialized_ = true;
    return kFmErrNone;
}

int8_t FmSynth::ValidatePatch(const dsp::FmPatch& patch) {
    if (!is_finitef(patch.feedback)) {
        return kFmErrPatch;
    }
    for (uint8_t n = 0; n < dsp::kNumOperators; ++n) {
        const dsp::FmOperatorPatch& op = patch.ops[n];
        if (op.wave >= dsp::WaveTable::SHAPE_COUNT) {
            return kFmErrPatch;
        }
        if (!(op.detune > 0.0f && op.detune <= kMaxDetune)) {
            return kFmErrPatch;
        }
        if (!(op.volume >= 0.0f && op.volume <= 1.0f)) {
            return kFmErrPatch;
        }
        if (!(op.env.sustain >= 0.0f && op.env.sustain <= 1.0f)) {
            return kFmErrPatch;
        }
    }
    return kFmErrNone;
}

// ============================================================================
// Control path
// ============================================================================

bool FmSynth::Push(uint8_t type, uint8_t note, uint8_t value, uint16_t value14) {
    SynthEvent event;
    event.type = type;
    event.note = note;
    event.value = value;
    event.value14 = value14;
    if (!events_.Push(event)) {
        dropped_events_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    return true;
}

bool FmSynth::NoteOn(uint8_t note, uint8_t velocity) {
    if (velocity == 0) {
        return NoteOff(note, 0);
    }
    return Push(EVENT_NOTE_ON, note, velocity, 0);
}

bool FmSynth::NoteOff(uint8_t note, uint8_t velocity) {
    return Push(EVENT_NOTE_OFF, note, velocity, 0);
}

bool FmSynth::HandlesController(uint8_t controller) const {
    switch (controller) {
        case common::kCCSustainPedal:
        case common::kCCAllNotesOff:
            return true;
        default:
            return false;
    }
}

bool FmSynth::ControlChange(uint8_t controller, uint8_t value) {
    switch (controller) {
        case common::kCCSustainPedal:
            return Push(EVENT_SUSTAIN, 0, value, 0);
        case common::kCCAllNotesOff:
            return AllNotesOff();
        default:
            return false;
    }
}

bool FmSynth::PitchBend(uint16_t value) {
    return Push(EVENT_PITCH_BEND, 0, 0, value);
}

// Accepted, no engine parameter follows these yet
bool FmSynth::ModWheel(uint16_t value) {
#ifdef DEBUG
    fprintf(stderr, "[FmSynth] ModWheel: %u\n", static_cast<unsigned>(value));
#else
    (void)value;
#endif
    return true;
}

bool FmSynth::Expression(uint16_t value) {
#ifdef DEBUG
    fprintf(stderr, "[FmSynth] Expression: %u\n", static_cast<unsigned>(value));
#else
    (void)value;
#endif
    return true;
}

bool FmSynth::AllNotesOff() {
    return Push(EVENT_ALL_NOTES_OFF, 0, 0, 0);
}

// ============================================================================
// Render path
// ============================================================================

void FmSynth::DrainEvents() {
    SynthEvent event;
    while (events_.Pop(&event)) {
        ApplyEvent(event);
    }
}

void FmSynth::ApplyEvent(const SynthEvent& event) {
    switch (event.type) {
        case EVENT_NOTE_ON:
            allocator_.NoteOn(event.note, event.value);
            break;
        case EVENT_NOTE_OFF:
            allocator_.NoteOff(event.note, event.value);
            break;
        case EVENT_SUSTAIN:
            allocator_.Sustain(event.value);
            break;
        case EVENT_PITCH_BEND:
            allocator_.PitchBend(event.value14);
            break;
        case EVENT_ALL_NOTES_OFF:
            allocator_.AllNotesOff();
            break;
        default:
            break;
    }
}

void FmSynth::RenderChecked(float* out, uint32_t frames) {
    mixer_.Render(allocator_, out, frames);

    const uint32_t samples = frames * 2;
    for (uint32_t i = 0; i < samples; ++i) {
        if (!is_finitef(out[i])) {
            memset(out, 0, samples * sizeof(float));
            fault_count_.fetch_add(1, std::memory_order_relaxed);
            return;
        }
    }
}

void FmSynth::Render(float* out, uint32_t frames) {
    if (!initialized_) {
        memset(out, 0, frames * 2 * sizeof(float));
        return;
    }
    DrainEvents();
    RenderChecked(out, frames);
}

void FmSynth::Render(int16_t* out, uint32_t frames) {
    if (!initialized_) {
        memset(out, 0, frames * 2 * sizeof(int16_t));
        return;
    }
    DrainEvents();

    while (frames > 0) {
        const uint32_t block = frames < dsp::kBlockSize ? frames : dsp::kBlockSize;
        RenderChecked(scratch_, block);
        for (uint32_t i = 0; i < block * 2; ++i) {
            out[i] = float_to_s16(scratch_[i]);
        }
        out += block * 2;
        frames -= block;
    }
}

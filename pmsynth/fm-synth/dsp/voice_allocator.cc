/*
 * File: voice_allocator.cc
 *
 * Description: Voice pool management for the FM engine
 */

#include "voice_allocator.h"
#include "../../common/midi_helper.h"

#ifdef DEBUG
#include <cstdio>
#endif

namespace dsp {

VoiceAllocator::VoiceAllocator()
    : polyphony_(0)
    , sustain_level_(0)
    , generation_(0)
    , released_while_sustained_()
{
    for (uint8_t i = 0; i < kMaxVoices; i++) {
        lru_[i] = i;
    }
}

bool VoiceAllocator::Init(uint8_t polyphony, const FmPatch& patch,
                          const WaveBank& waves, float sample_rate) {
    if (polyphony < 1 || polyphony > kMaxVoices) {
        return false;
    }
    polyphony_ = polyphony;
    for (uint8_t i = 0; i < polyphony_; i++) {
        voices_[i].Init(patch, waves, sample_rate);
    }
    AllNotesOff();
    return true;
}

// ============================================================================
// MIDI interface
// ============================================================================

void VoiceAllocator::NoteOn(uint8_t note, uint8_t velocity) {
    float pitch_hz;
    if (!common::MidiHelper::NoteToPitch(note, &pitch_hz)) {
        return;  // No pitch for this note
    }

    // One voice per pitch: a key struck again retriggers its own voice
    uint8_t voice_idx;
    if (!FindPitch(pitch_hz, &voice_idx)) {
        voice_idx = AllocateVoice();
    }
    Touch(voice_idx);
    released_while_sustained_.reset(note);

#ifdef DEBUG
    fprintf(stderr, "[VoiceAlloc] NoteOn: note=%d voice_idx=%d freq=%.2f Hz silent=%d\n",
            note, voice_idx, pitch_hz, voices_[voice_idx].IsSilent());
    fflush(stderr);
#endif

    voices_[voice_idx].NoteOn(pitch_hz, common::MidiHelper::VelocityToFloat(velocity));
}

void VoiceAllocator::NoteOff(uint8_t note, uint8_t velocity) {
    float pitch_hz;
    if (!common::MidiHelper::NoteToPitch(note, &pitch_hz)) {
        return;
    }

    if (IsSustained()) {
        // Keeps sounding until the pedal comes up
        released_while_sustained_.set(note);
        return;
    }

    ReleasePitch(pitch_hz, common::MidiHelper::VelocityToFloat(velocity));
}

void VoiceAllocator::Sustain(uint8_t value) {
    const bool was_sustained = IsSustained();
    sustain_level_ = value;

    if (was_sustained && !IsSustained()) {
        for (uint16_t note = 0; note < released_while_sustained_.size(); ++note) {
            if (!released_while_sustained_[note]) {
                continue;
            }
            float pitch_hz;
            if (common::MidiHelper::NoteToPitch(static_cast<uint8_t>(note), &pitch_hz)) {
                ReleasePitch(pitch_hz, 0.0f);
            }
        }
        released_while_sustained_.reset();
    }
}

void VoiceAllocator::PitchBend(uint16_t value) {
    const float ratio = common::MidiHelper::PitchBendToMultiplier(value);
    for (uint8_t i = 0; i < polyphony_; i++) {
        voices_[i].SetPitchRatio(ratio);
    }
}

void VoiceAllocator::AllNotesOff() {
    for (uint8_t i = 0; i < polyphony_; i++) {
        voices_[i].Reset();
    }
    for (uint8_t i = 0; i < kMaxVoices; i++) {
        lru_[i] = i;
    }
    released_while_sustained_.reset();
    ++generation_;

#ifdef DEBUG
    fprintf(stderr, "[VoiceAlloc] AllNotesOff: generation=%u\n", generation_);
    fflush(stderr);
#endif
}

uint8_t VoiceAllocator::VoicesPlaying(uint8_t note) const {
    float pitch_hz;
    if (!common::MidiHelper::NoteToPitch(note, &pitch_hz)) {
        return 0;
    }
    uint8_t count = 0;
    for (uint8_t i = 0; i < polyphony_; i++) {
        if (voices_[i].has_last_pitch() && voices_[i].last_pitch() == pitch_hz) {
            count++;
        }
    }
    return count;
}

// ============================================================================
// Private Helper Methods
// ============================================================================

bool VoiceAllocator::FindPitch(float pitch_hz, uint8_t* voice_idx) const {
    for (uint8_t i = 0; i < polyphony_; i++) {
        if (voices_[i].has_last_pitch() && voices_[i].last_pitch() == pitch_hz) {
            *voice_idx = i;
            return true;
        }
    }
    return false;
}

uint8_t VoiceAllocator::AllocateVoice() const {
    // First, a voice that makes no sound at all
    for (uint8_t pos = 0; pos < polyphony_; pos++) {
        if (voices_[lru_[pos]].IsSilent()) {
            return lru_[pos];
        }
    }

    // Then one whose note already ended and is only fading out
    for (uint8_t pos = 0; pos < polyphony_; pos++) {
        if (voices_[lru_[pos]].IsReleased()) {
            return lru_[pos];
        }
    }

    // All voices held - steal the least recently used
    return lru_[0];
}

void VoiceAllocator::Touch(uint8_t voice_idx) {
    uint8_t pos = 0;
    while (pos < polyphony_ && lru_[pos] != voice_idx) {
        pos++;
    }
    for (; pos + 1 < polyphony_; pos++) {
        lru_[pos] = lru_[pos + 1];
    }
    lru_[polyphony_ - 1] = voice_idx;
}

// Broadcast; each voice ignores pitches it is not currently playing
void VoiceAllocator::ReleasePitch(float pitch_hz, float velocity) {
    for (uint8_t i = 0; i < polyphony_; i++) {
        voices_[i].NoteOff(pitch_hz, velocity);
    }
}

}  // namespace dsp

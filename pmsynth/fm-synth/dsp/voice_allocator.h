/*
 * File: voice_allocator.h
 *
 * Description: Polyphonic voice pool for the FM engine
 *   - Least-recently-used voice reuse, with already-released voices
 *     preferred over sounding ones when a voice has to be stolen
 *   - Sustain pedal: note-offs are deferred while the pedal is down
 *   - Hard reset (all notes off) with a generation counter so the
 *     output stage notices the pool changed underneath it
 *
 * Single-threaded: every method runs on the render thread, between blocks.
 */

#pragma once

#include <bitset>
#include <cstdint>
#include "fm_patch.h"
#include "fm_voice.h"
#include "wavetable.h"

#ifndef PMSYNTH_MAX_VOICES
#define PMSYNTH_MAX_VOICES 16
#endif

namespace dsp {

class VoiceAllocator {
public:
    static constexpr uint8_t kMaxVoices = PMSYNTH_MAX_VOICES;

    // Pedal values above this hold notes
    static constexpr uint8_t kSustainThreshold = 32;

    VoiceAllocator();

    /**
     * @brief Build the voice pool
     * @param polyphony Number of voices, 1..kMaxVoices
     * @param patch Sound parameters applied to every voice
     * @param waves Table bank, must outlive the allocator
     * @param sample_rate Sample rate in Hz
     * @return False if polyphony is out of range
     */
    bool Init(uint8_t polyphony, const FmPatch& patch, const WaveBank& waves,
              float sample_rate);

    // MIDI interface
    void NoteOn(uint8_t note, uint8_t velocity);
    void NoteOff(uint8_t note, uint8_t velocity);
    void Sustain(uint8_t value);
    void PitchBend(uint16_t value);
    void AllNotesOff();

    // Getters
    uint8_t polyphony() const { return polyphony_; }
    uint32_t generation() const { return generation_; }
    uint8_t sustain_level() const { return sustain_level_; }
    bool IsSustained() const { return sustain_level_ > kSustainThreshold; }
    bool IsDeferred(uint8_t note) const { return note < 128 && released_while_sustained_[note]; }

    // Voices currently assigned to this note (0 or 1)
    uint8_t VoicesPlaying(uint8_t note) const;

    // Voice index at position pos of the LRU order (0 = least recently used)
    uint8_t lru(uint8_t pos) const { return lru_[pos]; }

    const FmVoice& GetVoice(uint8_t idx) const { return voices_[idx]; }
    FmVoice& GetVoiceMutable(uint8_t idx) { return voices_[idx]; }

private:
    FmVoice voices_[kMaxVoices];
    uint8_t lru_[kMaxVoices];
    uint8_t polyphony_;
    uint8_t sustain_level_;
    uint32_t generation_;
    std::bitset<128> released_while_sustained_;

    bool FindPitch(float pitch_hz, uint8_t* voice_idx) const;
    uint8_t AllocateVoice() const;
    void Touch(uint8_t voice_idx);
    void ReleasePitch(float pitch_hz, float velocity);

    // Prevent copying
    VoiceAllocator(const VoiceAllocator&) = delete;
    VoiceAllocator& operator=(const VoiceAllocator&) = delete;
};

}  // namespace dsp

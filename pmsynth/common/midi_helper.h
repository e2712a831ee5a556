/**
 * @file midi_helper.h
 * @brief MIDI constants and conversions
 *
 * Status bytes and controller numbers for the decoder, and the note,
 * velocity and bend conversions the voice pool needs.
 */

#pragma once

#include <cstdint>
#include <cmath>

namespace common {

// Channel voice messages (upper nibble of the status byte)
static constexpr uint8_t kMidiNoteOff = 0x80;
static constexpr uint8_t kMidiNoteOn = 0x90;
static constexpr uint8_t kMidiControlChange = 0xB0;
static constexpr uint8_t kMidiPitchBend = 0xE0;

// System real-time messages (no channel)
static constexpr uint8_t kMidiClock = 0xF8;
static constexpr uint8_t kMidiStart = 0xFA;
static constexpr uint8_t kMidiContinue = 0xFB;
static constexpr uint8_t kMidiStop = 0xFC;
static constexpr uint8_t kMidiSongPosition = 0xF2;

static constexpr uint8_t kMidiStripChannel = 0xF0;

// Controller numbers
static constexpr uint8_t kCCModWheel = 1;
static constexpr uint8_t kCCExpression = 11;
static constexpr uint8_t kCCModWheelLsb = 33;
static constexpr uint8_t kCCExpressionLsb = 43;
static constexpr uint8_t kCCSustainPedal = 64;
static constexpr uint8_t kCCAllNotesOff = 123;

static constexpr uint16_t kPitchBendCenter = 8192;

// Static conversions; nothing here allocates after InitTables()
class MidiHelper {
 public:
  // Notes C0 (12) through B7 (119) have a pitch; everything else is unmapped.
  static constexpr uint8_t kLowestNote = 12;
  static constexpr uint8_t kHighestNote = 119;

  /**
   * @brief Look up the pitch of a MIDI note in the static note table
   * @param note MIDI note number (A4=69)
   * @param pitch_hz Receives the frequency in Hz (A4 = 440Hz tuning)
   * @return False if the note has no entry in the table
   */
  static bool NoteToPitch(uint8_t note, float* pitch_hz) {
    if (note < kLowestNote || note > kHighestNote) {
      return false;
    }
    *pitch_hz = PitchTable()[note - kLowestNote];
    return true;
  }

  /**
   * @brief Build the note table ahead of the first lookup
   */
  static void InitTables() {
    PitchTable();
  }

  // 0..127 to 0..1
  static constexpr float VelocityToFloat(uint8_t velocity) {
    return static_cast<float>(velocity) / 127.0f;
  }

  /**
   * @brief Combine a 7-bit MSB and LSB pair into one 14-bit value
   */
  static constexpr uint16_t Combine14Bit(uint8_t msb, uint8_t lsb) {
    return static_cast<uint16_t>(((msb & 0x7F) << 7) | (lsb & 0x7F));
  }

  /**
   * @brief Bend offset in semitones
   * @param bend 14-bit value, kPitchBendCenter is no bend
   * @param range_semitones Offset at either extreme
   */
  static inline float PitchBendToSemitones(uint16_t bend,
                                           float range_semitones = 2.0f) {
    const float offset = static_cast<float>(bend) - static_cast<float>(kPitchBendCenter);
    return offset / static_cast<float>(kPitchBendCenter) * range_semitones;
  }

  /**
   * @brief Bend as a frequency ratio applied to every sounding operator
   * @return 2^(-2/12) at 0, 1.0 at the centre, just under 2^(2/12) at 16383
   */
  static inline float PitchBendToMultiplier(uint16_t bend,
                                            float range_semitones = 2.0f) {
    return powf(2.0f, PitchBendToSemitones(bend, range_semitones) / 12.0f);
  }

 private:
  struct Table {
    float hz[kHighestNote - kLowestNote + 1];
    Table() {
      for (int n = kLowestNote; n <= kHighestNote; ++n) {
        // f = 440 * 2^((n - 69) / 12)
        hz[n - kLowestNote] = 440.0f * powf(2.0f, (n - 69) / 12.0f);
      }
    }
  };

  static const float* PitchTable() {
    static const Table table;
    return table.hz;
  }
};

}  // namespace common

/**
 * @file midi_sink.h
 * @brief Receiver of decoded MIDI channel messages
 *
 * Implemented by the engine; the decoder only knows this interface.
 * Every method is called from the MIDI input thread.
 */

#pragma once

#include <cstdint>

namespace common {

class MidiSink {
 public:
  virtual ~MidiSink() {}

  // Return false if the message could not be delivered
  virtual bool NoteOn(uint8_t note, uint8_t velocity) = 0;
  virtual bool NoteOff(uint8_t note, uint8_t velocity) = 0;
  virtual bool ControlChange(uint8_t controller, uint8_t value) = 0;
  virtual bool PitchBend(uint16_t value) = 0;
  virtual bool ModWheel(uint16_t value) = 0;
  virtual bool Expression(uint16_t value) = 0;
  virtual bool AllNotesOff() = 0;

  // Controllers ControlChange() acts on
  virtual bool HandlesController(uint8_t controller) const = 0;
};

}  // namespace common

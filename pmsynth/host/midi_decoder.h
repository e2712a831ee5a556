/**
 * @file midi_decoder.h
 * @brief Raw MIDI bytes to engine calls
 *
 * Handles one channel. Mod wheel (CC 1/33) and expression (CC 11/43) are
 * combined into 14-bit values from the latest MSB and LSB seen.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include "../common/midi_sink.h"

namespace host {

class MidiDecoder {
public:
    /**
     * @param sink Receiver of decoded messages (borrowed)
     * @param channel MIDI channel 1-16
     */
    MidiDecoder(common::MidiSink* sink, uint8_t channel);

    /**
     * @brief Decode one complete message
     * @param data Message bytes, status first
     * @param size Number of bytes
     * @return True if the message was handled (including accepted no-ops)
     */
    bool Decode(const uint8_t* data, size_t size);

    void SetChannel(uint8_t channel);
    uint8_t channel() const { return static_cast<uint8_t>(channel_ + 1); }

    // Messages for our channel that nothing acts on
    uint32_t unhandled_count() const { return unhandled_count_; }

    // Messages the sink could not accept
    uint32_t rejected_count() const { return rejected_count_; }

    uint16_t mod_wheel() const;
    uint16_t expression() const;

private:
    common::MidiSink* sink_;
    uint8_t channel_;            // 0-based
    uint8_t last_cc_[128];       // Last value per controller
    uint32_t unhandled_count_;
    uint32_t rejected_count_;

    bool DecodeControlChange(uint8_t controller, uint8_t value);
    bool Deliver(bool accepted);
    void Unhandled(const uint8_t* data, size_t size);
};

}  // namespace host

/**
 * @file midi_decoder.cc
 * @brief Raw MIDI decoding
 */

#include "midi_decoder.h"
#include "../common/midi_helper.h"

#include <cstdio>
#include <cstring>

namespace host {

MidiDecoder::MidiDecoder(common::MidiSink* sink, uint8_t channel)
    : sink_(sink)
    , channel_(0)
    , unhandled_count_(0)
    , rejected_count_(0)
{
    memset(last_cc_, 0, sizeof(last_cc_));
    SetChannel(channel);
}

void MidiDecoder::SetChannel(uint8_t channel) {
    if (channel < 1 || channel > 16) {
        channel = 1;
    }
    channel_ = static_cast<uint8_t>(channel - 1);
}

uint16_t MidiDecoder::mod_wheel() const {
    return common::MidiHelper::Combine14Bit(last_cc_[common::kCCModWheel],
                                            last_cc_[common::kCCModWheelLsb]);
}

uint16_t MidiDecoder::expression() const {
    return common::MidiHelper::Combine14Bit(last_cc_[common::kCCExpression],
                                            last_cc_[common::kCCExpressionLsb]);
}

bool MidiDecoder::Decode(const uint8_t* data, size_t size) {
    if (size == 0) {
        return false;
    }

    const uint8_t status = data[0];

    // System messages carry no channel
    if ((status & common::kMidiStripChannel) == common::kMidiStripChannel) {
        switch (status) {
            case common::kMidiClock:
            case common::kMidiStart:
            case common::kMidiContinue:
            case common::kMidiStop:
            case common::kMidiSongPosition:
                return true;
            default:
                Unhandled(data, size);
                return false;
        }
    }

    if ((status & 0x0F) != channel_) {
        return false;  // Not our channel
    }

    const uint8_t type = status & common::kMidiStripChannel;
    const uint8_t data1 = size > 1 ? (data[1] & 0x7F) : 0;
    const uint8_t data2 = size > 2 ? (data[2] & 0x7F) : 0;

    switch (type) {
        case common::kMidiNoteOn:
            if (size < 3) break;
            if (data2 == 0) {
                return Deliver(sink_->NoteOff(data1, 0));
            }
            return Deliver(sink_->NoteOn(data1, data2));

        case common::kMidiNoteOff:
            if (size < 3) break;
            return Deliver(sink_->NoteOff(data1, data2));

        case common::kMidiControlChange:
            if (size < 3) break;
            return DecodeControlChange(data1, data2);

        case common::kMidiPitchBend:
            if (size < 3) break;
            return Deliver(sink_->PitchBend(static_cast<uint16_t>(data2 * 128 + data1)));

        default:
            break;
    }

    Unhandled(data, size);
    return false;
}

bool MidiDecoder::DecodeControlChange(uint8_t controller, uint8_t value) {
    last_cc_[controller] = value;

    switch (controller) {
        case common::kCCModWheel:
        case common::kCCModWheelLsb:
            return Deliver(sink_->ModWheel(mod_wheel()));
        case common::kCCExpression:
        case common::kCCExpressionLsb:
            return Deliver(sink_->Expression(expression()));
        default:
            break;
    }

    if (!sink_->HandlesController(controller)) {
        unhandled_count_++;
        fprintf(stderr, "[MidiDecoder] warning: unhandled CC %d value %d\n",
                controller, value);
        return false;
    }
    return Deliver(sink_->ControlChange(controller, value));
}

bool MidiDecoder::Deliver(bool accepted) {
    if (!accepted) {
        rejected_count_++;
    }
    return accepted;
}

void MidiDecoder::Unhandled(const uint8_t* data, size_t size) {
    unhandled_count_++;
    fprintf(stderr, "[MidiDecoder] warning: unhandled event");
    for (size_t i = 0; i < size && i < 3; ++i) {
        fprintf(stderr, " %02X", data[i]);
    }
    fprintf(stderr, "\n");
}

}  // namespace host

#include "midi_input.h"

#include <iostream>

namespace host {

static const char* kClientName = "pmsynth";

MidiInput::MidiInput(MidiDecoder* decoder)
    : decoder_(decoder)
{
}

MidiInput::~MidiInput() {
    Close();
}

bool MidiInput::CreateClient() {
    try {
        midi_in_.reset(new RtMidiIn(RtMidi::UNSPECIFIED, kClientName));
    } catch (const RtMidiError& e) {
        std::cerr << "[MIDI] Cannot create client: " << e.getMessage() << std::endl;
        midi_in_.reset();
        return false;
    }
    return true;
}

// Sysex, timing and active sensing are not needed
void MidiInput::Attach() {
    midi_in_->setErrorCallback(&MidiInput::ErrorCallback, this);
    midi_in_->ignoreTypes(true, true, true);
    midi_in_->setCallback(&MidiInput::Callback, this);
}

bool MidiInput::Open(const std::string& port_name) {
    Close();
    if (!CreateClient()) {
        return false;
    }

    try {
        const unsigned int count = midi_in_->getPortCount();
        for (unsigned int i = 0; i < count; ++i) {
            const std::string name = midi_in_->getPortName(i);
            if (name.find(port_name) != std::string::npos) {
                midi_in_->openPort(i, kClientName);
                Attach();
                port_name_ = name;
                std::cout << "[MIDI] Listening on \"" << name << "\"" << std::endl;
                return true;
            }
        }
    } catch (const RtMidiError& e) {
        std::cerr << "[MIDI] Cannot open \"" << port_name << "\": "
                  << e.getMessage() << std::endl;
        Close();
        return false;
    }

    std::cerr << "[MIDI] No input port matching \"" << port_name << "\"" << std::endl;
    Close();
    return false;
}

bool MidiInput::OpenVirtual(const std::string& port_name) {
    Close();
    if (!CreateClient()) {
        return false;
    }

    try {
        midi_in_->openVirtualPort(port_name);
        Attach();
    } catch (const RtMidiError& e) {
        std::cerr << "[MIDI] Cannot create virtual port \"" << port_name << "\": "
                  << e.getMessage() << std::endl;
        Close();
        return false;
    }

    port_name_ = port_name;
    std::cout << "[MIDI] Virtual port \"" << port_name << "\" ready" << std::endl;
    return true;
}

void MidiInput::Close() {
    if (!midi_in_) {
        return;
    }
    try {
        midi_in_->cancelCallback();
        midi_in_->closePort();
    } catch (const RtMidiError& e) {
        std::cerr << "[MIDI] Close failed: " << e.getMessage() << std::endl;
    }
    midi_in_.reset();
    port_name_.clear();
}

bool MidiInput::is_open() const {
    return midi_in_ && midi_in_->isPortOpen();
}

std::vector<std::string> MidiInput::ListPorts() {
    std::vector<std::string> names;
    try {
        RtMidiIn probe(RtMidi::UNSPECIFIED, kClientName);
        const unsigned int count = probe.getPortCount();
        for (unsigned int i = 0; i < count; ++i) {
            names.push_back(probe.getPortName(i));
        }
    } catch (const RtMidiError& e) {
        std::cerr << "[MIDI] Cannot list ports: " << e.getMessage() << std::endl;
        names.clear();
    }
    return names;
}

void MidiInput::Callback(double delta, std::vector<unsigned char>* message, void* user_data) {
    (void)delta;
    MidiInput* self = static_cast<MidiInput*>(user_data);
    if (message == nullptr || message->empty()) {
        return;
    }
    self->decoder_->Decode(message->data(), message->size());
}

void MidiInput::ErrorCallback(RtMidiError::Type type, const std::string& text, void* user_data) {
    (void)user_data;
    if (type == RtMidiError::WARNING || type == RtMidiError::DEBUG_WARNING) {
        std::cerr << "[MIDI] warning: " << text << std::endl;
    } else {
        std::cerr << "[MIDI] error: " << text << std::endl;
    }
}

}  // namespace host

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <RtMidi.h>

#include "midi_decoder.h"

namespace host {

// RtMidi input port feeding a MidiDecoder from RtMidi's callback thread.
class MidiInput {
public:
    explicit MidiInput(MidiDecoder* decoder);
    ~MidiInput();

    // Open the first input port whose name contains port_name.
    // Returns false and logs if RtMidi fails or no port matches.
    bool Open(const std::string& port_name);

    // Create a virtual input port other programs can connect to
    bool OpenVirtual(const std::string& port_name);

    void Close();

    bool is_open() const;
    const std::string& port_name() const { return port_name_; }

    // Names of all available input ports; empty on error
    static std::vector<std::string> ListPorts();

private:
    MidiDecoder* decoder_;
    std::unique_ptr<RtMidiIn> midi_in_;
    std::string port_name_;

    bool CreateClient();
    void Attach();

    static void Callback(double delta, std::vector<unsigned char>* message, void* user_data);
    static void ErrorCallback(RtMidiError::Type type, const std::string& text, void* user_data);

    MidiInput(const MidiInput&) = delete;
    MidiInput& operator=(const MidiInput&) = delete;
};

}  // namespace host

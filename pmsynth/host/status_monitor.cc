/**
 * @file status_monitor.cc
 * @brief Periodic report of the engine and driver error counters
 */

#include "status_monitor.h"

namespace host {

RuntimeCounters::RuntimeCounters()
    : render_faults(0)
    , dropped_events(0)
    , underruns(0)
    , callback_errors(0)
    , oversized_buffers(0)
    , cpu_load(0.0f)
{
}

int StatusMonitor::Report(const RuntimeCounters& now, std::ostream& out) {
    int lines = 0;

    if (now.render_faults != last_.render_faults) {
        out << "[Synth] " << (now.render_faults - last_.render_faults)
            << " block(s) with non-finite samples replaced by silence" << std::endl;
        lines++;
    }
    if (now.dropped_events != last_.dropped_events) {
        out << "[Synth] Event queue full, " << (now.dropped_events - last_.dropped_events)
            << " MIDI event(s) dropped" << std::endl;
        lines++;
    }
    if (now.underruns != last_.underruns) {
        out << "[Audio] " << (now.underruns - last_.underruns) << " output underrun(s), cpu "
            << static_cast<int>(now.cpu_load * 100.0f) << "%" << std::endl;
        lines++;
    }
    if (now.callback_errors != last_.callback_errors) {
        out << "[Audio] " << (now.callback_errors - last_.callback_errors)
            << " callback error(s)" << std::endl;
        lines++;
    }
    if (now.oversized_buffers != last_.oversized_buffers) {
        out << "[Audio] " << (now.oversized_buffers - last_.oversized_buffers)
            << " callback(s) above " << kMaxFramesPerBuffer << " frames" << std::endl;
        lines++;
    }

    last_ = now;
    return lines;
}

}  // namespace host

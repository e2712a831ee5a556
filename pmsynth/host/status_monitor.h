/**
 * @file status_monitor.h
 * @brief Periodic report of the engine and driver error counters
 *
 * The counters are cumulative and written by the render thread; the control
 * thread samples them and logs only what moved since the previous sample.
 */

#pragma once

#include <cstdint>
#include <ostream>

namespace host {

// Largest buffer the driver may ask for in one callback
static constexpr uint32_t kMaxFramesPerBuffer = 2400;

struct RuntimeCounters {
    uint32_t render_faults;       // FmSynth::fault_count()
    uint32_t dropped_events;      // FmSynth::dropped_events()
    uint32_t underruns;           // AudioEngine::buffer_underruns()
    uint32_t callback_errors;     // AudioEngine::callback_errors()
    uint32_t oversized_buffers;   // AudioEngine::oversized_buffers()
    float cpu_load;               // 0..1, reported with underruns

    RuntimeCounters();
};

class StatusMonitor {
public:
    StatusMonitor() {}

    /**
     * @brief Log one line per counter that grew since the last call
     * @return Number of lines written
     */
    int Report(const RuntimeCounters& now, std::ostream& out);

    const RuntimeCounters& last() const { return last_; }

private:
    RuntimeCounters last_;
};

}  // namespace host

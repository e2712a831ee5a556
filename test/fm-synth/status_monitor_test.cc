#include <cstdio>
#include <sstream>
#include <string>
#include "host/status_monitor.h"

static bool Contains(const std::string& text, const char* needle) {
  return text.find(needle) != std::string::npos;
}

int main() {
  host::StatusMonitor monitor;
  host::RuntimeCounters counters;
  std::ostringstream log;

  // Nothing moved, nothing logged
  if (monitor.Report(counters, log) != 0 || !log.str().empty()) {
    std::fprintf(stderr, "FAIL: idle counters were logged\n");
    return 1;
  }

  // Oversized driver buffers are reported with the limit
  counters.oversized_buffers = 3;
  if (monitor.Report(counters, log) != 1 ||
      !Contains(log.str(), "[Audio] 3 callback(s) above 2400 frames")) {
    std::fprintf(stderr, "FAIL: oversized buffers not logged: %s\n", log.str().c_str());
    return 1;
  }

  // Only the increase since the previous report is logged
  log.str("");
  counters.oversized_buffers = 5;
  counters.dropped_events = 7;
  counters.render_faults = 1;
  if (monitor.Report(counters, log) != 3 ||
      !Contains(log.str(), "[Audio] 2 callback(s) above") ||
      !Contains(log.str(), "7 MIDI event(s) dropped") ||
      !Contains(log.str(), "[Synth] 1 block(s)")) {
    std::fprintf(stderr, "FAIL: counter deltas: %s\n", log.str().c_str());
    return 1;
  }

  log.str("");
  counters.underruns = 2;
  counters.cpu_load = 0.5f;
  counters.callback_errors = 1;
  if (monitor.Report(counters, log) != 2 ||
      !Contains(log.str(), "2 output underrun(s), cpu 50%") ||
      !Contains(log.str(), "1 callback error(s)")) {
    std::fprintf(stderr, "FAIL: driver counters: %s\n", log.str().c_str());
    return 1;
  }

  log.str("");
  if (monitor.Report(counters, log) != 0 || monitor.last().oversized_buffers != 5) {
    std::fprintf(stderr, "FAIL: unchanged counters logged again\n");
    return 1;
  }

  std::printf("status monitor tests passed\n");
  return 0;
}

#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "core/log_classifier.h"
#include "runtime/state.h"

namespace lswitch {

/// Tails one backend's combined output on a background thread and applies
/// what it reads to the shared service state. Ends only at end-of-stream.
class LogMonitor {
public:
    // Takes ownership of `fd`.
    LogMonitor(ServiceState& state, int fd, uint64_t generation);
    ~LogMonitor();

    LogMonitor(const LogMonitor&) = delete;
    LogMonitor& operator=(const LogMonitor&) = delete;

    void start();
    void join();
    bool finished() const { return finished_.load(); }
    uint64_t generation() const { return generation_; }

    // Append `line` and apply `events` to `data`. The caller holds the
    // service lock. Lines from a superseded generation are dropped.
    static void apply(ServiceData& data, uint64_t generation, const std::string& line,
                      const std::vector<LogEvent>& events);

private:
    void run();
    void processLine(const std::string& line);

    ServiceState& state_;
    int fd_;
    uint64_t generation_;
    std::thread worker_;
    std::atomic<bool> finished_{false};
};

}  // namespace lswitch

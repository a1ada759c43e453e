#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace lswitch {

enum class LogEventType {
    Ready,         // backend finished loading and is listening
    PromptMetric,  // prompt evaluation: tokens and tokens/s
    EvalMetric,    // generation: tokens and tokens/s
    SlotRelease,   // request finished: context tokens consumed
};

const char* to_string(LogEventType type);

struct LogEvent {
    LogEventType type;
    int64_t tokens{0};
    double tokens_per_second{0.0};
};

/// Classify one line of backend output. Stateless and thread-safe.
/// A line may carry several events; an empty result means the line is
/// unrecognized. Throws std::invalid_argument / std::out_of_range when a
/// metric line matches but its numbers do not convert.
std::vector<LogEvent> classifyLogLine(const std::string& line);

bool isReadinessMarker(const std::string& line);

}  // namespace lswitch

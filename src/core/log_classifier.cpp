#include "core/log_classifier.h"

#include <array>
#include <regex>

namespace lswitch {

namespace {

constexpr std::array<const char*, 4> kReadyMarkers = {
    "main: model loaded",
    "\"msg\":\"model loaded\"",
    "server is listening on",
    "main: server is listening",
};

const std::regex& promptEvalPattern() {
    static const std::regex re(
        R"(prompt eval time\s*=\s*[\d.]+\s*ms\s*/\s*(\d+)\s*tokens\s*\(\s*[\d.]+\s*ms per token,\s*([\d.]+)\s*tokens per second\))");
    return re;
}

// Group 1 is the character (if any) in front of "eval time"; it must not be
// part of "prompt eval time".
const std::regex& evalPattern() {
    static const std::regex re(
        R"((^|\s)eval time\s*=\s*[\d.]+\s*ms\s*/\s*(\d+)\s*tokens\s*\(\s*[\d.]+\s*ms per token,\s*([\d.]+)\s*tokens per second\))");
    return re;
}

const std::regex& releasePattern() {
    static const std::regex re(R"(stop processing: n_tokens = (\d+))");
    return re;
}

bool endsWith(const std::string& text, size_t end, const std::string& suffix) {
    return end >= suffix.size() && text.compare(end - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

const char* to_string(LogEventType type) {
    switch (type) {
        case LogEventType::Ready:
            return "ready";
        case LogEventType::PromptMetric:
            return "prompt_metric";
        case LogEventType::EvalMetric:
            return "eval_metric";
        case LogEventType::SlotRelease:
            return "slot_release";
    }
    return "unknown";
}

bool isReadinessMarker(const std::string& line) {
    for (const char* marker : kReadyMarkers) {
        if (line.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::vector<LogEvent> classifyLogLine(const std::string& line) {
    std::vector<LogEvent> events;

    if (isReadinessMarker(line)) {
        events.push_back({LogEventType::Ready, 0, 0.0});
    }

    std::smatch m;
    if (std::regex_search(line, m, promptEvalPattern())) {
        events.push_back({LogEventType::PromptMetric, std::stoll(m[1].str()), std::stod(m[2].str())});
    }

    for (std::sregex_iterator it(line.begin(), line.end(), evalPattern()), end; it != end; ++it) {
        const std::smatch& em = *it;
        const size_t eval_pos = static_cast<size_t>(em.position(0) + em.length(1));
        if (endsWith(line, eval_pos, "prompt ") || endsWith(line, eval_pos, "prompt\t")) {
            continue;
        }
        events.push_back({LogEventType::EvalMetric, std::stoll(em[2].str()), std::stod(em[3].str())});
        break;
    }

    if (std::regex_search(line, m, releasePattern())) {
        events.push_back({LogEventType::SlotRelease, std::stoll(m[1].str()), 0.0});
    }

    return events;
}

}  // namespace lswitch

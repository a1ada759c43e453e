#include "core/log_monitor.h"

#include <cerrno>
#include <cstring>
#include <exception>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "utils/logger.h"

namespace lswitch {

namespace {

std::string rstrip(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' ||
                          s.back() == '\t' || s.back() == '\v' || s.back() == '\f')) {
        s.pop_back();
    }
    return s;
}

}  // namespace

LogMonitor::LogMonitor(ServiceState& state, int fd, uint64_t generation)
    : state_(state), fd_(fd), generation_(generation) {}

LogMonitor::~LogMonitor() {
    join();
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void LogMonitor::start() {
    worker_ = std::thread(&LogMonitor::run, this);
}

void LogMonitor::join() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

void LogMonitor::apply(ServiceData& data, uint64_t generation, const std::string& line,
                       const std::vector<LogEvent>& events) {
    if (data.generation != generation) {
        return;
    }
    data.logs.append(line);
    if (!data.backend) {
        return;
    }

    for (const auto& ev : events) {
        switch (ev.type) {
            case LogEventType::Ready:
                if (!data.ready) {
                    data.ready = true;
                    data.backend->status = BackendStatus::Ready;
                    spdlog::info("[Monitor] Backend '{}' is ready on port {}",
                                 data.backend->model_key, data.backend->port);
                }
                break;
            case LogEventType::PromptMetric:
                data.stats.prompt_speed = ev.tokens_per_second;
                break;
            case LogEventType::EvalMetric:
                data.stats.gen_speed = ev.tokens_per_second;
                data.stats.total_tokens += ev.tokens;
                break;
            case LogEventType::SlotRelease:
                data.stats.ctx_used = ev.tokens;
                if (data.current_ctx > 0) {
                    data.stats.ctx_limit = data.current_ctx;
                }
                break;
        }
    }
}

void LogMonitor::processLine(const std::string& line) {
    logger::backend()->log(logger::backend_line_level(), "{}", line);

    std::vector<LogEvent> events;
    try {
        events = classifyLogLine(line);
    } catch (const std::exception& e) {
        spdlog::warn("[Monitor] Failed to parse log line '{}': {}", line, e.what());
    }

    auto guard = state_.lock();
    apply(*guard, generation_, line, events);
}

void LogMonitor::run() {
    std::string pending;
    char buf[4096];

    while (true) {
        const ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            spdlog::warn("[Monitor] Read error on backend output: {}", std::strerror(errno));
            break;
        }
        if (n == 0) break;

        pending.append(buf, static_cast<size_t>(n));
        size_t start = 0;
        size_t nl = 0;
        while ((nl = pending.find('\n', start)) != std::string::npos) {
            processLine(rstrip(pending.substr(start, nl - start)));
            start = nl + 1;
        }
        pending.erase(0, start);
    }
    if (!pending.empty()) {
        processLine(rstrip(pending));
    }

    ::close(fd_);
    fd_ = -1;
    spdlog::debug("[Monitor] Output stream of generation {} closed", generation_);
    finished_ = true;
}

}  // namespace lswitch

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace lswitch::logger {

// Name of the logger that carries child process output.
inline constexpr const char* kBackendLoggerName = "backend";

struct LogSettings {
    std::string level{"info"};
    // Lines echoed from the backend are written at this level.
    std::string backend_level{"debug"};
    // Empty disables the daily JSON-lines file.
    std::string dir;
    int retention_days{7};
    bool console{true};
};

// Case-insensitive. Unknown text maps to info.
spdlog::level::level_enum parse_level(const std::string& level_text);

// LSWITCH_LOG_DIR, or ~/.llama-switch/logs.
std::string get_log_dir();

// <log dir>/llama-switch.jsonl.YYYY-MM-DD for today.
std::string get_log_file_path();

// LSWITCH_LOG_RETENTION_DAYS when in 1..364, otherwise 7.
int get_retention_days();

// Deletes llama-switch.jsonl.<date> files older than retention_days.
void cleanup_old_logs(const std::string& log_dir, int retention_days);

// Settings from LSWITCH_LOG_LEVEL, LSWITCH_BACKEND_LOG_LEVEL,
// LSWITCH_LOG_DIR and LSWITCH_LOG_RETENTION_DAYS.
LogSettings settings_from_env();

// Installs the default "llama-switch" logger and the "backend" logger on
// one shared set of sinks. extra_sinks are appended (tests inject
// ostream sinks here). Returns the path of the file sink, or "" if none.
std::string init(const LogSettings& settings, std::vector<spdlog::sink_ptr> extra_sinks = {});

void init_from_env();

// The backend logger, or the default logger before init().
std::shared_ptr<spdlog::logger> backend();

// Level used for echoed backend lines.
spdlog::level::level_enum backend_line_level();

}  // namespace lswitch::logger

#include "utils/logger.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace fs = std::filesystem;

namespace lswitch::logger {

namespace {

constexpr const char* kFilePrefix = "llama-switch.jsonl.";
constexpr int kDefaultRetentionDays = 7;

constexpr const char* kConsolePattern = "[%Y-%m-%d %T.%e] [%n] [%l] %v";
constexpr const char* kFilePattern =
    R"({"ts":"%Y-%m-%dT%H:%M:%S.%e","logger":"%n","level":"%l","msg":"%v"})";

std::atomic<spdlog::level::level_enum> g_backend_line_level{spdlog::level::debug};

std::string date_string(std::chrono::system_clock::time_point tp) {
    const auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d");
    return oss.str();
}

std::string env_or(const char* name, const std::string& fallback) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : fallback;
}

}  // namespace

spdlog::level::level_enum parse_level(const std::string& level_text) {
    std::string text = level_text;
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (text == "warning") return spdlog::level::warn;
    if (text == "fatal") return spdlog::level::critical;
    // spdlog answers "off" for names it does not know.
    const auto lvl = spdlog::level::from_str(text);
    if (lvl == spdlog::level::off && text != "off") return spdlog::level::info;
    return lvl;
}

std::string get_log_dir() {
    const std::string home = env_or("HOME", "/tmp");
    return env_or("LSWITCH_LOG_DIR", (fs::path(home) / ".llama-switch" / "logs").string());
}

std::string get_log_file_path() {
    return (fs::path(get_log_dir()) /
            (kFilePrefix + date_string(std::chrono::system_clock::now())))
        .string();
}

int get_retention_days() {
    const std::string text = env_or("LSWITCH_LOG_RETENTION_DAYS", "");
    if (text.empty()) return kDefaultRetentionDays;
    try {
        const int days = std::stoi(text);
        return (days > 0 && days < 365) ? days : kDefaultRetentionDays;
    } catch (const std::exception&) {
        return kDefaultRetentionDays;
    }
}

void cleanup_old_logs(const std::string& log_dir, int retention_days) {
    std::error_code ec;
    fs::directory_iterator it(log_dir, ec);
    if (ec) return;

    const std::string oldest_kept = date_string(std::chrono::system_clock::now() -
                                                std::chrono::hours(24 * retention_days));
    const std::string prefix = kFilePrefix;
    for (const auto& entry : it) {
        const std::string name = entry.path().filename().string();
        if (!entry.is_regular_file(ec) || name.compare(0, prefix.size(), prefix) != 0) continue;
        // ISO dates sort lexically.
        if (name.substr(prefix.size()) < oldest_kept) {
            fs::remove(entry.path(), ec);
        }
    }
}

LogSettings settings_from_env() {
    LogSettings settings;
    settings.level = env_or("LSWITCH_LOG_LEVEL", settings.level);
    settings.backend_level = env_or("LSWITCH_BACKEND_LOG_LEVEL", settings.backend_level);
    settings.dir = get_log_dir();
    settings.retention_days = get_retention_days();
    return settings;
}

std::string init(const LogSettings& settings, std::vector<spdlog::sink_ptr> extra_sinks) {
    std::vector<spdlog::sink_ptr> sinks;
    if (settings.console) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern(kConsolePattern);
        sinks.push_back(console);
    }

    std::string file_path;
    if (!settings.dir.empty()) {
        std::error_code ec;
        fs::create_directories(settings.dir, ec);
        if (!ec) {
            cleanup_old_logs(settings.dir, settings.retention_days);
            file_path = (fs::path(settings.dir) /
                         (kFilePrefix + date_string(std::chrono::system_clock::now())))
                            .string();
            try {
                auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false);
                file->set_pattern(kFilePattern);
                sinks.push_back(file);
            } catch (const spdlog::spdlog_ex&) {
                file_path.clear();
            }
        }
    }

    for (auto& sink : extra_sinks) sinks.push_back(std::move(sink));

    auto main_logger = std::make_shared<spdlog::logger>("llama-switch", sinks.begin(), sinks.end());
    auto backend_logger = std::make_shared<spdlog::logger>(kBackendLoggerName, sinks.begin(), sinks.end());

    spdlog::drop(kBackendLoggerName);
    spdlog::set_default_logger(main_logger);
    spdlog::register_logger(backend_logger);

    spdlog::set_level(parse_level(settings.level));
    g_backend_line_level = parse_level(settings.backend_level);
    spdlog::flush_on(spdlog::level::info);

    if (!settings.dir.empty() && file_path.empty()) {
        spdlog::warn("File logging disabled: cannot write to {}", settings.dir);
    }
    return file_path;
}

void init_from_env() {
    const std::string path = init(settings_from_env());
    if (!path.empty()) spdlog::info("Logging to {}", path);
}

std::shared_ptr<spdlog::logger> backend() {
    auto lg = spdlog::get(kBackendLoggerName);
    return lg ? lg : spdlog::default_logger();
}

spdlog::level::level_enum backend_line_level() { return g_backend_line_level.load(); }

}  // namespace lswitch::logger

#include "utils/config.h"
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <spdlog/spdlog.h>

namespace lswitch {

namespace {

std::optional<std::string> getEnvValue(const char* name) {
    if (!name || !*name) {
        return std::nullopt;
    }
    if (const char* v = std::getenv(name)) {
        return std::string(v);
    }
    return std::nullopt;
}

std::optional<int> parseInt(const std::string& name, const std::string& value) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used == value.size()) return v;
    } catch (const std::exception&) {
    }
    spdlog::warn("Ignoring {}='{}': not an integer", name, value);
    return std::nullopt;
}

bool parseBool(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "1" || lower == "true" || lower == "yes" || lower == "on";
}

std::filesystem::path defaultSettingsPath() {
    std::filesystem::path home = getEnvValue("HOME").value_or("");
    if (home.empty()) return std::filesystem::path();
    return home / ".llama-switch/settings.json";
}

bool readJson(const std::filesystem::path& path, nlohmann::json& out) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return false;
    std::ifstream ifs(path);
    if (!ifs.is_open()) return false;
    out = nlohmann::json::parse(ifs, nullptr, false);
    if (out.is_discarded() || !out.is_object()) {
        spdlog::warn("Ignoring settings file {}: not a JSON object", path.string());
        return false;
    }
    return true;
}

void applyJson(const nlohmann::json& j, ServerConfig& cfg) {
    auto get_ms = [&j](const char* key, std::chrono::milliseconds& out) {
        if (j.contains(key) && j[key].is_number_integer()) {
            out = std::chrono::milliseconds(j[key].get<long long>());
        }
    };
    auto get_s = [&j](const char* key, std::chrono::seconds& out) {
        if (j.contains(key) && j[key].is_number_integer()) {
            out = std::chrono::seconds(j[key].get<long long>());
        }
    };

    if (j.contains("host") && j["host"].is_string()) cfg.host = j["host"].get<std::string>();
    if (j.contains("port") && j["port"].is_number_integer()) cfg.port = j["port"].get<int>();
    if (j.contains("ctx") && j["ctx"].is_number_integer()) cfg.default_ctx = j["ctx"].get<int>();
    if (j.contains("config") && j["config"].is_string()) {
        cfg.models_config = j["config"].get<std::string>();
    }
    if (j.contains("watch") && j["watch"].is_boolean()) cfg.watch = j["watch"].get<bool>();
    if (j.contains("ui_dir") && j["ui_dir"].is_string()) cfg.ui_dir = j["ui_dir"].get<std::string>();
    if (j.contains("cors_enabled") && j["cors_enabled"].is_boolean()) {
        cfg.cors_enabled = j["cors_enabled"].get<bool>();
    }
    if (j.contains("cors_allow_origin") && j["cors_allow_origin"].is_string()) {
        cfg.cors_allow_origin = j["cors_allow_origin"].get<std::string>();
    }
    if (j.contains("gzip_enabled") && j["gzip_enabled"].is_boolean()) {
        cfg.gzip_enabled = j["gzip_enabled"].get<bool>();
    }
    if (j.contains("ready_poll_attempts") && j["ready_poll_attempts"].is_number_integer()) {
        cfg.ready_poll_attempts = j["ready_poll_attempts"].get<int>();
    }
    get_ms("watch_interval_ms", cfg.watch_interval);
    get_ms("ready_poll_interval_ms", cfg.ready_poll_interval);
    get_ms("stop_grace_ms", cfg.stop_grace);
    get_s("proxy_connect_timeout_s", cfg.proxy_connect_timeout);
    get_s("proxy_read_timeout_s", cfg.proxy_read_timeout);
}

}  // namespace

std::pair<ServerConfig, std::string> loadServerConfigWithLog() {
    ServerConfig cfg;
    std::ostringstream log;
    bool used_env = false;
    bool used_file = false;

    // file
    std::filesystem::path settings_path;
    if (auto env = getEnvValue("LSWITCH_SETTINGS")) {
        settings_path = *env;
    } else {
        settings_path = defaultSettingsPath();
    }
    if (!settings_path.empty()) {
        nlohmann::json j;
        if (readJson(settings_path, j)) {
            applyJson(j, cfg);
            log << "file=" << settings_path << " ";
            used_file = true;
        }
    }

    // env overrides
    if (auto v = getEnvValue("LSWITCH_HOST")) {
        cfg.host = *v;
        log << "env:HOST=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("LSWITCH_PORT")) {
        if (auto port = parseInt("LSWITCH_PORT", *v)) {
            cfg.port = *port;
            log << "env:PORT=" << cfg.port << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("LSWITCH_CTX")) {
        if (auto ctx = parseInt("LSWITCH_CTX", *v)) {
            cfg.default_ctx = *ctx;
            log << "env:CTX=" << cfg.default_ctx << " ";
            used_env = true;
        }
    }
    if (auto v = getEnvValue("LSWITCH_CONFIG")) {
        cfg.models_config = *v;
        log << "env:CONFIG=" << *v << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("LSWITCH_WATCH")) {
        cfg.watch = parseBool(*v);
        log << "env:WATCH=" << (cfg.watch ? "true" : "false") << " ";
        used_env = true;
    }
    if (auto v = getEnvValue("LSWITCH_UI_DIR")) {
        cfg.ui_dir = *v;
        log << "env:UI_DIR=" << *v << " ";
        used_env = true;
    }

    if (log.tellp() > 0) log << "|";
    log << "sources=";
    if (used_env) log << "env";
    if (used_file) {
        if (used_env) log << ",";
        log << "file";
    }
    if (!used_env && !used_file) log << "default";

    return {cfg, log.str()};
}

ServerConfig loadServerConfig() {
    auto info = loadServerConfigWithLog();
    return info.first;
}

}  // namespace lswitch

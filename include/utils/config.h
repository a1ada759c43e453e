#pragma once

#include <chrono>
#include <string>
#include <utility>

namespace lswitch {

struct ServerConfig {
    std::string host{"localhost"};
    int port{11435};
    int default_ctx{4096};
    std::string models_config{"config.yaml"};
    bool watch{false};
    std::chrono::milliseconds watch_interval{std::chrono::seconds(2)};
    std::string ui_dir{"."};
    bool cors_enabled{true};
    std::string cors_allow_origin{"*"};
    bool gzip_enabled{true};
    std::chrono::milliseconds ready_poll_interval{std::chrono::seconds(1)};
    int ready_poll_attempts{60};
    std::chrono::milliseconds stop_grace{std::chrono::seconds(5)};
    std::chrono::seconds proxy_connect_timeout{10};
    std::chrono::seconds proxy_read_timeout{3600};
};

// Defaults, then the JSON settings file (LSWITCH_SETTINGS or
// ~/.llama-switch/settings.json), then LSWITCH_* environment variables.
// The second member describes which sources were applied.
std::pair<ServerConfig, std::string> loadServerConfigWithLog();
ServerConfig loadServerConfig();

}  // namespace lswitch

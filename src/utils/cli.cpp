#include "utils/cli.h"
#include "utils/version.h"
#include <sstream>
#include <cstring>
#include <stdexcept>

namespace lswitch {

namespace {

bool isFlag(const char* arg, const char* short_name, const char* long_name) {
    return (short_name && std::strcmp(arg, short_name) == 0) || std::strcmp(arg, long_name) == 0;
}

CliResult errorResult(const std::string& message) {
    CliResult result;
    result.should_exit = true;
    result.exit_code = 1;
    result.output = "error: " + message + "\n\nRun 'llama-switch --help' for usage.\n";
    return result;
}

bool parsePositiveInt(const char* text, int& out) {
    try {
        size_t used = 0;
        const std::string s(text);
        int v = std::stoi(s, &used);
        if (used != s.size() || v <= 0) return false;
        out = v;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

}  // namespace

std::string getHelpMessage() {
    std::ostringstream oss;
    oss << "llama-switch " << LSWITCH_VERSION << " - single-backend model switchboard\n";
    oss << "\n";
    oss << "USAGE:\n";
    oss << "    llama-switch [OPTIONS]\n";
    oss << "\n";
    oss << "OPTIONS:\n";
    oss << "    -H, --host <HOST>      Bind address (default: localhost)\n";
    oss << "    -p, --port <PORT>      UI / API port (default: 11435)\n";
    oss << "    -c, --ctx <SIZE>       Default context size (default: 4096)\n";
    oss << "    -f, --config <PATH>    Models config file (default: config.yaml)\n";
    oss << "    -w, --watch            Reload the models config when it changes\n";
    oss << "        --ui-dir <DIR>     Directory holding static/ and templates/ (default: .)\n";
    oss << "    -h, --help             Print help information\n";
    oss << "    -V, --version          Print version information\n";
    oss << "\n";
    oss << "ENVIRONMENT VARIABLES:\n";
    oss << "    LSWITCH_HOST, LSWITCH_PORT, LSWITCH_CTX, LSWITCH_CONFIG,\n";
    oss << "    LSWITCH_WATCH, LSWITCH_UI_DIR     Same as the options above\n";
    oss << "    LSWITCH_SETTINGS                  JSON settings file (default: ~/.llama-switch/settings.json)\n";
    oss << "    LSWITCH_LOG_LEVEL                 Log level (trace|debug|info|warn|error)\n";
    oss << "    LSWITCH_LOG_DIR                   Log directory (default: ~/.llama-switch/logs)\n";
    oss << "    LSWITCH_LOG_RETENTION_DAYS        Log retention days (default: 7)\n";
    return oss.str();
}

std::string getVersionMessage() {
    std::ostringstream oss;
    oss << "llama-switch " << LSWITCH_VERSION << "\n";
    return oss.str();
}

CliResult parseCliArgs(int argc, char* argv[]) {
    CliResult result;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (isFlag(arg, "-h", "--help")) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getHelpMessage();
            return result;
        }
        if (isFlag(arg, "-V", "--version")) {
            result.should_exit = true;
            result.exit_code = 0;
            result.output = getVersionMessage();
            return result;
        }
        if (isFlag(arg, "-w", "--watch")) {
            result.options.watch = true;
            continue;
        }

        const bool takes_value = isFlag(arg, "-H", "--host") || isFlag(arg, "-p", "--port") ||
                                 isFlag(arg, "-c", "--ctx") || isFlag(arg, "-f", "--config") ||
                                 isFlag(arg, nullptr, "--ui-dir");
        if (!takes_value) {
            return errorResult(std::string("unknown argument '") + arg + "'");
        }
        if (i + 1 >= argc) {
            return errorResult(std::string("missing value for ") + arg);
        }
        const char* value = argv[++i];

        if (isFlag(arg, "-H", "--host")) {
            result.options.host = value;
        } else if (isFlag(arg, "-p", "--port")) {
            int port = 0;
            if (!parsePositiveInt(value, port) || port > 65535) {
                return errorResult(std::string("invalid port '") + value + "'");
            }
            result.options.port = port;
        } else if (isFlag(arg, "-c", "--ctx")) {
            int ctx = 0;
            if (!parsePositiveInt(value, ctx)) {
                return errorResult(std::string("invalid context size '") + value + "'");
            }
            result.options.ctx = ctx;
        } else if (isFlag(arg, "-f", "--config")) {
            result.options.config = value;
        } else {
            result.options.ui_dir = value;
        }
    }
    return result;
}

void applyServeOptions(const ServeOptions& options, ServerConfig& config) {
    if (options.host) config.host = *options.host;
    if (options.port) config.port = *options.port;
    if (options.ctx) config.default_ctx = *options.ctx;
    if (options.config) config.models_config = *options.config;
    if (options.watch) config.watch = true;
    if (options.ui_dir) config.ui_dir = *options.ui_dir;
}

}  // namespace lswitch

#pragma once

#include <optional>
#include <string>

#include "utils/config.h"

namespace lswitch {

/// Command-line overrides. Unset fields keep the value from
/// loadServerConfig().
struct ServeOptions {
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<int> ctx;
    std::optional<std::string> config;
    bool watch{false};
    std::optional<std::string> ui_dir;
};

/// Result of CLI argument parsing
struct CliResult {
    /// Whether the program should exit immediately (e.g., after --help or --version)
    bool should_exit{false};

    /// Exit code to use if should_exit is true
    int exit_code{0};

    /// Output message to display (help text, version info, or error message)
    std::string output;

    ServeOptions options;
};

/// Parse command line arguments
///
/// @param argc Number of arguments
/// @param argv Argument values
/// @return CliResult indicating whether to continue or exit
CliResult parseCliArgs(int argc, char* argv[]);

/// Apply parsed overrides on top of `config`.
void applyServeOptions(const ServeOptions& options, ServerConfig& config);

std::string getHelpMessage();
std::string getVersionMessage();

}  // namespace lswitch

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "utils/cli.h"
#include "utils/version.h"

using namespace lswitch;

namespace {

CliResult parse(std::vector<std::string> args) {
    std::vector<char*> argv;
    for (auto& s : args) argv.push_back(s.data());
    argv.push_back(nullptr);
    return parseCliArgs(static_cast<int>(args.size()), argv.data());
}

}  // namespace

TEST(CliTest, HelpFlagShowsHelpMessage) {
    CliResult result = parse({"llama-switch", "--help"});

    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_NE(result.output.find("llama-switch"), std::string::npos);
    EXPECT_NE(result.output.find("OPTIONS"), std::string::npos);
    EXPECT_NE(result.output.find("LSWITCH_PORT"), std::string::npos);
}

TEST(CliTest, ShortHelpFlagShowsHelpMessage) {
    CliResult result = parse({"llama-switch", "-h"});

    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_NE(result.output.find("--watch"), std::string::npos);
}

TEST(CliTest, VersionFlagShowsVersion) {
    for (const char* flag : {"--version", "-V"}) {
        CliResult result = parse({"llama-switch", flag});
        EXPECT_TRUE(result.should_exit) << flag;
        EXPECT_EQ(result.exit_code, 0);
        EXPECT_NE(result.output.find(LSWITCH_VERSION), std::string::npos);
    }
}

TEST(CliTest, NoArgumentsContinuesWithDefaults) {
    CliResult result = parse({"llama-switch"});

    EXPECT_FALSE(result.should_exit);
    EXPECT_FALSE(result.options.host.has_value());
    EXPECT_FALSE(result.options.port.has_value());
    EXPECT_FALSE(result.options.watch);
}

TEST(CliTest, ParsesServeOptions) {
    CliResult result = parse({"llama-switch", "--host", "0.0.0.0", "-p", "9000", "--ctx", "8192",
                              "-f", "/etc/models.yaml", "-w", "--ui-dir", "/srv/ui"});

    ASSERT_FALSE(result.should_exit) << result.output;
    EXPECT_EQ(result.options.host.value_or(""), "0.0.0.0");
    EXPECT_EQ(result.options.port.value_or(0), 9000);
    EXPECT_EQ(result.options.ctx.value_or(0), 8192);
    EXPECT_EQ(result.options.config.value_or(""), "/etc/models.yaml");
    EXPECT_TRUE(result.options.watch);
    EXPECT_EQ(result.options.ui_dir.value_or(""), "/srv/ui");
}

TEST(CliTest, UnknownArgumentFails) {
    CliResult result = parse({"llama-switch", "--bogus"});

    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.output.find("unknown argument '--bogus'"), std::string::npos);
}

TEST(CliTest, InvalidPortFails) {
    for (const char* value : {"abc", "0", "70000", "80x"}) {
        CliResult result = parse({"llama-switch", "--port", value});
        EXPECT_TRUE(result.should_exit) << value;
        EXPECT_EQ(result.exit_code, 1);
        EXPECT_NE(result.output.find("invalid port"), std::string::npos);
    }
}

TEST(CliTest, MissingValueFails) {
    CliResult result = parse({"llama-switch", "--ctx"});

    EXPECT_TRUE(result.should_exit);
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_NE(result.output.find("missing value"), std::string::npos);
}

TEST(CliTest, ApplyServeOptionsOverridesOnlySetFields) {
    ServerConfig config;
    config.host = "127.0.0.1";
    config.port = 11435;
    config.models_config = "config.yaml";

    ServeOptions options;
    options.port = 12000;
    options.watch = true;
    applyServeOptions(options, config);

    EXPECT_EQ(config.host, "127.0.0.1");
    EXPECT_EQ(config.port, 12000);
    EXPECT_EQ(config.models_config, "config.yaml");
    EXPECT_TRUE(config.watch);
}

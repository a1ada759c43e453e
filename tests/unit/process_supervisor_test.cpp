#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <memory>
#include <string>

#include "core/process_supervisor.h"
#include "core/switch_error.h"
#include "models/model_config.h"
#include "runtime/state.h"
#include "../support/test_helpers.h"

using namespace lswitch;
using lswitch::test::TempDir;
using lswitch::test::waitUntil;
using lswitch::test::writeModelsConfig;

namespace {

constexpr const char* kReadyCmd =
    "echo port ${PORT} ctx ${CTX} host ${HOST}; echo main: model loaded; exec sleep 30";
constexpr const char* kSilentCmd = "echo port ${PORT}; exec sleep 30";
constexpr const char* kStubbornCmd =
    "trap '' TERM; echo main: model loaded; : ${PORT}; while :; do sleep 1; done";
constexpr const char* kShortLivedCmd = "echo main: model loaded; : ${PORT}; exit 0";
constexpr const char* kMetricsCmd =
    "echo main: model loaded; : ${PORT}; "
    "echo 'prompt eval time = 40.00 ms / 8 tokens (5.00 ms per token, 200.00 tokens per second)'; "
    "echo '       eval time = 100.00 ms / 5 tokens (20.00 ms per token, 50.00 tokens per second)'; "
    "echo 'slot release: id 0 | task 1 | stop processing: n_tokens = 13, truncated = 0'; "
    "exec sleep 30";

bool pidAlive(pid_t pid) { return ::kill(pid, 0) == 0; }

class ProcessSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_path_ = dir_.path / "config.yaml";
        writeModelsConfig(config_path_, {{"alpha", kReadyCmd},
                                         {"beta", kReadyCmd},
                                         {"silent", kSilentCmd},
                                         {"stubborn", kStubbornCmd},
                                         {"short", kShortLivedCmd},
                                         {"metrics", kMetricsCmd}});
        store_ = std::make_unique<ModelConfigStore>(config_path_);
        ASSERT_TRUE(store_->reload());
        state_ = std::make_unique<ServiceState>(*store_, 4096, "127.0.0.1");
        SupervisorOptions options;
        options.stop_grace = std::chrono::milliseconds(300);
        supervisor_ = std::make_unique<ProcessSupervisor>(*state_, options);
    }

    void TearDown() override {
        supervisor_.reset();
        state_.reset();
        store_.reset();
    }

    bool waitReady() {
        return waitUntil([this]() { return supervisor_->status().ready; });
    }

    TempDir dir_;
    std::filesystem::path config_path_;
    std::unique_ptr<ModelConfigStore> store_;
    std::unique_ptr<ServiceState> state_;
    std::unique_ptr<ProcessSupervisor> supervisor_;
};

}  // namespace

TEST_F(ProcessSupervisorTest, InitialStatusIsStopped) {
    StatusReport st = supervisor_->status();
    EXPECT_FALSE(st.running);
    EXPECT_FALSE(st.ready);
    EXPECT_FALSE(st.model.has_value());
    EXPECT_FALSE(st.port.has_value());
    EXPECT_FALSE(st.pid.has_value());
    EXPECT_EQ(st.host, "127.0.0.1");
    EXPECT_EQ(st.status, BackendStatus::Stopped);
}

TEST_F(ProcessSupervisorTest, StartSubstitutesAndBecomesReady) {
    StartResult result = supervisor_->start("alpha", 2048);

    EXPECT_GT(result.port, 0);
    EXPECT_NE(result.command.find("port " + std::to_string(result.port) + " ctx 2048 host 127.0.0.1"),
              std::string::npos);

    ASSERT_TRUE(waitReady());
    StatusReport st = supervisor_->status();
    EXPECT_TRUE(st.running);
    EXPECT_EQ(st.model.value_or(""), "alpha");
    EXPECT_EQ(st.port.value_or(0), result.port);
    ASSERT_TRUE(st.pid.has_value());
    EXPECT_TRUE(pidAlive(*st.pid));
    EXPECT_EQ(st.ctx, 2048);
    EXPECT_EQ(st.status, BackendStatus::Ready);

    auto guard = state_->lock();
    auto lines = guard->logs.snapshot();
    ASSERT_GE(lines.size(), 2u);
    EXPECT_EQ(lines[0], "port " + std::to_string(result.port) + " ctx 2048 host 127.0.0.1");
    EXPECT_EQ(lines[1], "main: model loaded");
}

TEST_F(ProcessSupervisorTest, StartUsesDefaultContext) {
    StartResult result = supervisor_->start("alpha");
    EXPECT_NE(result.command.find("ctx 4096"), std::string::npos);
    EXPECT_EQ(supervisor_->status().ctx, 4096);
}

TEST_F(ProcessSupervisorTest, UnknownModelLeavesCurrentBackend) {
    supervisor_->start("alpha");
    ASSERT_TRUE(waitReady());
    const pid_t pid = supervisor_->status().pid.value_or(-1);

    try {
        supervisor_->start("missing");
        FAIL() << "expected SwitchError";
    } catch (const SwitchError& e) {
        EXPECT_EQ(e.code(), SwitchErrorCode::kModelNotFound);
    }

    StatusReport st = supervisor_->status();
    EXPECT_TRUE(st.running);
    EXPECT_TRUE(st.ready);
    EXPECT_EQ(st.model.value_or(""), "alpha");
    EXPECT_EQ(st.pid.value_or(-2), pid);
}

TEST_F(ProcessSupervisorTest, StartReplacesRunningBackend) {
    supervisor_->start("alpha");
    ASSERT_TRUE(waitReady());
    const pid_t old_pid = supervisor_->status().pid.value_or(-1);

    supervisor_->start("silent");
    EXPECT_FALSE(pidAlive(old_pid));

    StatusReport st = supervisor_->status();
    EXPECT_TRUE(st.running);
    EXPECT_FALSE(st.ready);
    EXPECT_EQ(st.model.value_or(""), "silent");
    EXPECT_NE(st.pid.value_or(old_pid), old_pid);
    EXPECT_EQ(st.status, BackendStatus::Starting);
}

TEST_F(ProcessSupervisorTest, RestartingSameModelGetsNewProcess) {
    supervisor_->start("beta");
    ASSERT_TRUE(waitReady());
    const pid_t first = supervisor_->status().pid.value_or(-1);

    supervisor_->start("beta");
    ASSERT_TRUE(waitReady());
    EXPECT_NE(supervisor_->status().pid.value_or(first), first);
}

TEST_F(ProcessSupervisorTest, StopIsIdempotent) {
    supervisor_->stop();
    EXPECT_FALSE(supervisor_->status().running);

    supervisor_->start("alpha");
    ASSERT_TRUE(waitReady());
    const pid_t pid = supervisor_->status().pid.value_or(-1);

    supervisor_->stop();
    supervisor_->stop();

    StatusReport st = supervisor_->status();
    EXPECT_FALSE(st.running);
    EXPECT_FALSE(st.ready);
    EXPECT_FALSE(st.model.has_value());
    EXPECT_FALSE(st.port.has_value());
    EXPECT_EQ(st.status, BackendStatus::Stopped);
    EXPECT_FALSE(pidAlive(pid));
}

TEST_F(ProcessSupervisorTest, StopEscalatesForStubbornBackend) {
    supervisor_->start("stubborn");
    ASSERT_TRUE(waitReady());
    const pid_t pid = supervisor_->status().pid.value_or(-1);

    const auto begin = std::chrono::steady_clock::now();
    supervisor_->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(3));

    EXPECT_FALSE(supervisor_->status().running);
    EXPECT_TRUE(waitUntil([pid]() { return !pidAlive(pid); }));
}

TEST_F(ProcessSupervisorTest, ExitedBackendIsReportedNotRunning) {
    supervisor_->start("short");
    ASSERT_TRUE(waitUntil([this]() { return !supervisor_->status().running; }));

    StatusReport st = supervisor_->status();
    EXPECT_FALSE(st.running);
    EXPECT_EQ(st.model.value_or(""), "short");
    EXPECT_FALSE(st.port.has_value());
    EXPECT_FALSE(st.pid.has_value());
}

TEST_F(ProcessSupervisorTest, MonitorFeedsStatistics) {
    supervisor_->start("metrics", 1024);
    ASSERT_TRUE(waitUntil([this]() { return supervisor_->status().stats.ctx_used == 13; }));

    StatusReport st = supervisor_->status();
    EXPECT_DOUBLE_EQ(st.stats.prompt_speed, 200.0);
    EXPECT_DOUBLE_EQ(st.stats.gen_speed, 50.0);
    EXPECT_EQ(st.stats.total_tokens, 5);
    EXPECT_EQ(st.stats.ctx_limit, 1024);

    supervisor_->start("alpha");
    st = supervisor_->status();
    EXPECT_EQ(st.stats.total_tokens, 0);
    EXPECT_EQ(st.stats.ctx_used, 0);
}

TEST_F(ProcessSupervisorTest, StoppingKeepsLogHistory) {
    supervisor_->start("alpha");
    ASSERT_TRUE(waitReady());
    supervisor_->stop();

    auto guard = state_->lock();
    EXPECT_FALSE(guard->logs.empty());
}

TEST_F(ProcessSupervisorTest, FailedLaunchLeavesSlotStopped) {
    // Same store and state, but every launch after the first fails.
    auto launches = std::make_shared<int>(0);
    SupervisorOptions options;
    options.stop_grace = std::chrono::milliseconds(300);
    options.spawn = [launches](const std::string& command) {
        if (++*launches > 1) {
            throw SwitchError(SwitchErrorCode::kSpawnFailure, "pipe failed: Too many open files");
        }
        return spawnProcessGroup(command);
    };
    supervisor_ = std::make_unique<ProcessSupervisor>(*state_, options);

    supervisor_->start("alpha");
    ASSERT_TRUE(waitReady());
    const pid_t alpha_pid = *supervisor_->status().pid;

    SwitchErrorCode code = static_cast<SwitchErrorCode>(0);
    try {
        supervisor_->start("beta");
    } catch (const SwitchError& e) {
        code = e.code();
    }
    EXPECT_EQ(code, SwitchErrorCode::kSpawnFailure);

    StatusReport st = supervisor_->status();
    EXPECT_FALSE(st.running);
    EXPECT_FALSE(st.ready);
    EXPECT_FALSE(st.model.has_value());
    EXPECT_FALSE(st.port.has_value());
    EXPECT_FALSE(st.pid.has_value());
    EXPECT_EQ(st.status, BackendStatus::Stopped);
    EXPECT_EQ(st.stats.total_tokens, 0);
    // The previous backend was torn down before the launch was attempted.
    EXPECT_TRUE(waitUntil([alpha_pid]() { return !pidAlive(alpha_pid); }));
}

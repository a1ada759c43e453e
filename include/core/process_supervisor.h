#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

#include "runtime/state.h"
#include "system/process.h"

namespace lswitch {

class LogMonitor;

struct SupervisorOptions {
    // SIGTERM -> SIGKILL escalation window.
    std::chrono::milliseconds stop_grace{std::chrono::seconds(5)};
    // Launches the substituted command. Tests replace it to simulate
    // launch failures.
    std::function<SpawnedProcess(const std::string&)> spawn = spawnProcessGroup;
};

struct StartResult {
    int port{0};
    std::string command;
};

/// Point-in-time view of the backend slot, taken under the service lock.
struct StatusReport {
    bool running{false};
    bool ready{false};
    std::optional<std::string> model;
    int ctx{0};
    std::optional<int> port;
    std::optional<pid_t> pid;
    std::string host;
    StatsSnapshot stats;
    BackendStatus status{BackendStatus::Stopped};
};

/// Owns the backend process lifecycle. At most one backend exists; start()
/// always tears down the current one before installing the next.
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(ServiceState& state, SupervisorOptions options = {});
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    // Throws SwitchError(kModelNotFound) for an unknown key (nothing is
    // touched) and SwitchError(kSpawnFailure) if the launch fails (the slot
    // is left Stopped).
    StartResult start(const std::string& model_key, std::optional<int> ctx = std::nullopt);

    // Idempotent.
    void stop();

    StatusReport status();

private:
    void stopLocked(ServiceState::Guard& guard);
    void reapMonitors();

    ServiceState& state_;
    SupervisorOptions options_;

    std::mutex monitors_mutex_;
    std::vector<std::unique_ptr<LogMonitor>> monitors_;
};

}  // namespace lswitch

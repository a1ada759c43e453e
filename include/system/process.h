#pragma once

#include <chrono>
#include <string>
#include <sys/types.h>

namespace lswitch {

// Result of launching a shell command in its own session.
struct SpawnedProcess {
    pid_t pid{-1};
    int output_fd{-1};  // read end of the combined stdout/stderr pipe
};

// Launch `command` through /bin/sh in a new session (setsid), so the child
// and everything it forks share one process group whose id equals the pid.
// stdout and stderr are redirected into a single pipe returned to the caller.
// Throws SwitchError(kSpawnFailure) if the pipe or fork fails.
SpawnedProcess spawnProcessGroup(const std::string& command);

// Owning handle for a child process leader. Not copyable; the handle is the
// only place the child is ever waited on.
class ProcessHandle {
public:
    ProcessHandle() = default;
    explicit ProcessHandle(pid_t pid) : pid_(pid) {}
    ~ProcessHandle() = default;

    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;
    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;

    pid_t pid() const { return pid_; }
    bool valid() const { return pid_ > 0; }

    // Non-blocking liveness check. Each call asks the OS again until the
    // exit has been observed; the exit is remembered because a child can
    // only be reaped once.
    bool isRunning();

    // SIGTERM to the whole group, wait up to `grace`, then SIGKILL the group.
    // Returns true if the process exited within the grace period. After a
    // forced kill the child is reaped on a detached thread.
    bool terminateGroup(std::chrono::milliseconds grace);

    int exitStatus() const { return exit_status_; }

private:
    void releaseToReaper();

    pid_t pid_{-1};
    bool exited_{false};
    int exit_status_{-1};
};

}  // namespace lswitch

#include "system/process.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include "core/switch_error.h"

namespace lswitch {

namespace {

constexpr const char* kShellPath = "/bin/sh";
constexpr auto kExitPollInterval = std::chrono::milliseconds(50);

std::string errnoMessage(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

int decodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

}  // namespace

SpawnedProcess spawnProcessGroup(const std::string& command) {
    int out_pipe[2];
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        throw SwitchError(SwitchErrorCode::kSpawnFailure, errnoMessage("pipe failed"));
    }
    int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

    // Everything the child touches is prepared before fork(); only
    // async-signal-safe calls are made between fork() and exec.
    const char* argv[] = {"sh", "-c", command.c_str(), nullptr};

    pid_t pid = ::fork();
    if (pid < 0) {
        const std::string msg = errnoMessage("fork failed");
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        if (devnull >= 0) ::close(devnull);
        throw SwitchError(SwitchErrorCode::kSpawnFailure, msg);
    }

    if (pid == 0) {
        ::setsid();
        // Ignored signals survive exec; the backend gets default SIGPIPE.
        ::signal(SIGPIPE, SIG_DFL);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(out_pipe[1], STDERR_FILENO);
        ::execv(kShellPath, const_cast<char* const*>(argv));
        ::_exit(127);
    }

    ::close(out_pipe[1]);
    if (devnull >= 0) ::close(devnull);
    return SpawnedProcess{pid, out_pipe[0]};
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), exited_(other.exited_), exit_status_(other.exit_status_) {
    other.pid_ = -1;
    other.exited_ = false;
    other.exit_status_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        pid_ = other.pid_;
        exited_ = other.exited_;
        exit_status_ = other.exit_status_;
        other.pid_ = -1;
        other.exited_ = false;
        other.exit_status_ = -1;
    }
    return *this;
}

bool ProcessHandle::isRunning() {
    if (!valid() || exited_) {
        return false;
    }
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == 0) {
        return true;
    }
    if (r < 0 && errno == EINTR) {
        return true;
    }
    exited_ = true;
    exit_status_ = r == pid_ ? decodeWaitStatus(status) : -1;
    return false;
}

bool ProcessHandle::terminateGroup(std::chrono::milliseconds grace) {
    if (!valid()) {
        return true;
    }
    if (!isRunning()) {
        // Leader is gone; clear anything it left behind in its group.
        ::killpg(pid_, SIGKILL);
        return true;
    }

    if (::killpg(pid_, SIGTERM) != 0 && errno != ESRCH) {
        spdlog::warn("SIGTERM to process group {} failed: {}", pid_, std::strerror(errno));
    }

    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!isRunning()) {
            return true;
        }
        std::this_thread::sleep_for(kExitPollInterval);
    }
    if (!isRunning()) {
        return true;
    }

    spdlog::warn("Process group {} still alive after {}ms, sending SIGKILL", pid_, grace.count());
    if (::killpg(pid_, SIGKILL) != 0 && errno != ESRCH) {
        spdlog::error("SIGKILL to process group {} failed: {}", pid_, std::strerror(errno));
    }
    releaseToReaper();
    return false;
}

void ProcessHandle::releaseToReaper() {
    const pid_t pid = pid_;
    exited_ = true;
    std::thread([pid]() {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }).detach();
}

}  // namespace lswitch

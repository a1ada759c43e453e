#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "runtime/log_buffer.h"
#include "system/process.h"

namespace lswitch {

class ModelConfigStore;

// Process-wide shutdown flag, flipped from the signal handler.
extern std::atomic<bool> g_running_flag;

inline bool is_running() { return g_running_flag.load(); }
inline void request_shutdown() { g_running_flag.store(false); }

enum class BackendStatus { Stopped, Starting, Ready, Stopping };

const char* to_string(BackendStatus status);

struct StatsSnapshot {
    int64_t ctx_used{0};
    int64_t ctx_limit{0};
    int64_t total_tokens{0};
    double prompt_speed{0.0};
    double gen_speed{0.0};
};

/// The one live backend. Move-only because it owns the process handle.
struct BackendProcess {
    std::string model_key;
    int ctx{0};
    int port{0};
    ProcessHandle process;
    BackendStatus status{BackendStatus::Starting};
    uint64_t generation{0};
};

/// Every mutable field of the service. Only reachable through
/// ServiceState::lock(), so nothing here is touched without the mutex.
struct ServiceData {
    std::optional<BackendProcess> backend;
    bool ready{false};
    StatsSnapshot stats;
    LogBuffer logs;
    int current_ctx{0};
    int default_ctx{4096};
    std::string host{"localhost"};
    // Bumped on every start; identifies which log monitor is current.
    uint64_t generation{0};

    BackendStatus status() const {
        return backend ? backend->status : BackendStatus::Stopped;
    }
};

class ServiceState {
public:
    /// Scoped access to ServiceData; holds the service mutex for its lifetime.
    class Guard {
    public:
        Guard(Guard&&) = default;

        ServiceData* operator->() { return data_; }
        const ServiceData* operator->() const { return data_; }
        ServiceData& operator*() { return *data_; }

    private:
        friend class ServiceState;
        Guard(std::mutex& mutex, ServiceData& data) : lock_(mutex), data_(&data) {}

        std::unique_lock<std::mutex> lock_;
        ServiceData* data_;
    };

    ServiceState(ModelConfigStore& config, int default_ctx, std::string host,
                 size_t log_capacity = LogBuffer::kDefaultCapacity);

    ServiceState(const ServiceState&) = delete;
    ServiceState& operator=(const ServiceState&) = delete;

    Guard lock() { return Guard(mutex_, data_); }

    // The model mapping has its own guard; it is not covered by lock().
    ModelConfigStore& config() { return config_; }

private:
    ModelConfigStore& config_;
    std::mutex mutex_;
    ServiceData data_;
};

}  // namespace lswitch

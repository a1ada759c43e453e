#include "runtime/state.h"

#include <utility>

namespace lswitch {

std::atomic<bool> g_running_flag{true};

const char* to_string(BackendStatus status) {
    switch (status) {
        case BackendStatus::Stopped:
            return "stopped";
        case BackendStatus::Starting:
            return "starting";
        case BackendStatus::Ready:
            return "ready";
        case BackendStatus::Stopping:
            return "stopping";
    }
    return "unknown";
}

ServiceState::ServiceState(ModelConfigStore& config, int default_ctx, std::string host,
                           size_t log_capacity)
    : config_(config) {
    data_.default_ctx = default_ctx;
    data_.host = std::move(host);
    data_.logs = LogBuffer(log_capacity);
}

}  // namespace lswitch

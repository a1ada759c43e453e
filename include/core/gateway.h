#pragma once

#include <chrono>
#include <string>

#include "core/process_supervisor.h"

namespace lswitch {

struct GatewayOptions {
    std::chrono::milliseconds poll_interval{std::chrono::seconds(1)};
    int max_attempts{60};
};

/// Where a ready backend can be reached.
struct BackendTarget {
    std::string model;
    std::string host;
    int port{0};
};

/// Auto-load router for completion requests: makes sure the requested model
/// is the live backend and waits until it reports ready.
class Gateway {
public:
    explicit Gateway(ProcessSupervisor& supervisor, GatewayOptions options = {});

    // Extract the "model" field. Throws SwitchError(kBadRequest) if the body
    // is not JSON or the field is missing.
    static std::string requestedModel(const std::string& body);

    // Start or swap to `model` when needed, then wait for readiness.
    // Throws kModelNotFound, kSpawnFailure or kReadinessTimeout. A backend
    // that never became ready is left running.
    BackendTarget ensureBackend(const std::string& model);

    // Address used to reach a backend started with bind host `host`.
    static std::string backendAddress(const std::string& host);

private:
    ProcessSupervisor& supervisor_;
    GatewayOptions options_;
};

}  // namespace lswitch

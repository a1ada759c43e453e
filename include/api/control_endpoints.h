#pragma once

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace lswitch {

class ProcessSupervisor;
class ServiceState;
struct StatusReport;

/// Operator routes: backend start/stop, status, logs, config, health and
/// log level.
class ControlEndpoints {
public:
    ControlEndpoints(ProcessSupervisor& supervisor, ServiceState& state);

    void registerRoutes(httplib::Server& server);

    static nlohmann::json statusToJson(const StatusReport& report);

private:
    ProcessSupervisor& supervisor_;
    ServiceState& state_;
};

}  // namespace lswitch

#include "core/gateway.h"

#include <thread>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/switch_error.h"

namespace lswitch {

Gateway::Gateway(ProcessSupervisor& supervisor, GatewayOptions options)
    : supervisor_(supervisor), options_(options) {}

std::string Gateway::requestedModel(const std::string& body) {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw SwitchError(SwitchErrorCode::kBadRequest, "Request body must be a JSON object");
    }
    auto it = j.find("model");
    if (it == j.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw SwitchError(SwitchErrorCode::kBadRequest, "Model not specified");
    }
    return it->get<std::string>();
}

std::string Gateway::backendAddress(const std::string& host) {
    if (host.empty() || host == "0.0.0.0") return "127.0.0.1";
    if (host == "::" || host == "[::]") return "::1";
    return host;
}

BackendTarget Gateway::ensureBackend(const std::string& model) {
    const StatusReport current = supervisor_.status();
    if (!current.running || current.model != model) {
        spdlog::info("[Gateway] Switching model: {} -> {}", current.model.value_or("none"), model);
        supervisor_.start(model);
    }

    for (int attempt = 0;; ++attempt) {
        const StatusReport st = supervisor_.status();
        if (st.ready) {
            if (!st.running || !st.port) {
                throw SwitchError(SwitchErrorCode::kProxyTransportError,
                                  "Backend for '" + model + "' exited after becoming ready");
            }
            if (st.model != model) {
                spdlog::warn("[Gateway] Requested '{}' but '{}' is live; forwarding anyway", model,
                             st.model.value_or("none"));
            }
            return BackendTarget{st.model.value_or(model), backendAddress(st.host), *st.port};
        }
        if (attempt >= options_.max_attempts) {
            break;
        }
        std::this_thread::sleep_for(options_.poll_interval);
    }

    spdlog::error("[Gateway] Model '{}' not ready after {} checks", model, options_.max_attempts);
    throw SwitchError(SwitchErrorCode::kReadinessTimeout,
                      "Model '" + model + "' failed to become ready in time");
}

}  // namespace lswitch

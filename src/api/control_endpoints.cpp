#include "api/control_endpoints.h"

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "api/openai_endpoints.h"
#include "core/process_supervisor.h"
#include "core/switch_error.h"
#include "models/model_config.h"
#include "runtime/state.h"
#include "utils/logger.h"

namespace lswitch {

using json = nlohmann::json;

ControlEndpoints::ControlEndpoints(ProcessSupervisor& supervisor, ServiceState& state)
    : supervisor_(supervisor), state_(state) {}

json ControlEndpoints::statusToJson(const StatusReport& report) {
    json body = {
        {"running", report.running},
        {"ready", report.ready},
        {"model", nullptr},
        {"ctx", report.ctx},
        {"port", nullptr},
        {"host", report.host},
        {"pid", nullptr},
        {"status", to_string(report.status)},
        {"stats", {
            {"ctx_used", report.stats.ctx_used},
            {"ctx_limit", report.stats.ctx_limit},
            {"total_tokens", report.stats.total_tokens},
            {"prompt_speed", report.stats.prompt_speed},
            {"gen_speed", report.stats.gen_speed}
        }}
    };
    if (report.model) body["model"] = *report.model;
    if (report.port) body["port"] = *report.port;
    if (report.pid) body["pid"] = *report.pid;
    return body;
}

void ControlEndpoints::registerRoutes(httplib::Server& server) {
    server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        OpenAIEndpoints::setJson(res, {{"status", "ok"}});
    });

    server.Get("/api/config", [this](const httplib::Request&, httplib::Response& res) {
        const auto catalog = state_.config().getModels();
        json models = json::object();
        for (const auto& def : catalog->models()) {
            models[def.key] = def.metadata;
        }
        int default_ctx = 0;
        {
            auto guard = state_.lock();
            default_ctx = guard->default_ctx;
        }
        OpenAIEndpoints::setJson(res, {{"models", models}, {"default_ctx", default_ctx}});
    });

    server.Get("/api/status", [this](const httplib::Request&, httplib::Response& res) {
        OpenAIEndpoints::setJson(res, statusToJson(supervisor_.status()));
    });

    server.Get("/api/logs", [this](const httplib::Request&, httplib::Response& res) {
        std::vector<std::string> lines;
        {
            auto guard = state_.lock();
            lines = guard->logs.snapshot();
        }
        OpenAIEndpoints::setJson(res, json(lines));
    });

    server.Post("/api/stop", [this](const httplib::Request&, httplib::Response& res) {
        supervisor_.stop();
        OpenAIEndpoints::setJson(res, {{"status", "stopped"}});
    });

    server.Post("/api/start", [this](const httplib::Request& req, httplib::Response& res) {
        auto j = json::parse(req.body, nullptr, false);
        if (j.is_discarded() || !j.is_object() || !j.contains("model_key") ||
            !j["model_key"].is_string()) {
            OpenAIEndpoints::respondError(res, 400, "bad_request", "model_key required");
            return;
        }
        std::optional<int> ctx;
        if (j.contains("ctx") && !j["ctx"].is_null()) {
            // Values past INT64_MAX come back negative and fail the range check.
            const int64_t requested = j["ctx"].is_number_integer() ? j["ctx"].get<int64_t>() : 0;
            if (requested <= 0 || requested > std::numeric_limits<int>::max()) {
                OpenAIEndpoints::respondError(res, 400, "bad_request", "ctx must be a positive integer");
                return;
            }
            ctx = static_cast<int>(requested);
        }

        try {
            const StartResult started = supervisor_.start(j["model_key"].get<std::string>(), ctx);
            OpenAIEndpoints::setJson(res, {{"status", "started"},
                                           {"port", started.port},
                                           {"command", started.command}});
        } catch (const SwitchError& e) {
            OpenAIEndpoints::respondError(res, e);
        }
    });

    server.Get("/log/level", [](const httplib::Request&, httplib::Response& res) {
        json body = {{"level", spdlog::level::to_string_view(spdlog::get_level()).data()}};
        OpenAIEndpoints::setJson(res, body);
    });

    server.Post("/log/level", [](const httplib::Request& req, httplib::Response& res) {
        auto j = json::parse(req.body, nullptr, false);
        if (j.is_discarded() || !j.contains("level") || !j["level"].is_string()) {
            res.status = 400;
            res.set_content(R"({"error":"level required"})", "application/json");
            return;
        }
        spdlog::set_level(logger::parse_level(j["level"].get<std::string>()));
        json body = {{"level", spdlog::level::to_string_view(spdlog::get_level()).data()}};
        OpenAIEndpoints::setJson(res, body);
    });
}

}  // namespace lswitch

#include "api/openai_endpoints.h"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "api/stream_proxy.h"
#include "core/gateway.h"
#include "core/switch_error.h"
#include "models/model_config.h"

namespace lswitch {

using json = nlohmann::json;

namespace {

std::string errorCode(SwitchErrorCode code) {
    std::string s = to_string(code);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

}  // namespace

OpenAIEndpoints::OpenAIEndpoints(ModelConfigStore& config, Gateway& gateway, StreamProxy& proxy)
    : config_(config), gateway_(gateway), proxy_(proxy) {}

void OpenAIEndpoints::setJson(httplib::Response& res, const json& body) {
    res.set_content(body.dump(), "application/json");
}

void OpenAIEndpoints::respondError(httplib::Response& res, int status, const std::string& code,
                                   const std::string& message) {
    res.status = status;
    std::string type = "invalid_request_error";
    if (status == 504) {
        type = "timeout_error";
    } else if (status >= 500) {
        type = "internal_error";
    } else if (status == 404) {
        type = "not_found_error";
    }
    setJson(res, {{"error", {{"message", message}, {"type", type}, {"code", code}}}});
}

void OpenAIEndpoints::respondError(httplib::Response& res, const SwitchError& error) {
    respondError(res, httpStatusFor(error.code()), errorCode(error.code()), error.what());
}

json OpenAIEndpoints::listModels() const {
    const auto catalog = config_.getModels();
    const ModelMeta meta;

    json data = json::array();
    json models = json::array();
    for (const auto& def : catalog->models()) {
        data.push_back({
            {"id", def.key},
            {"object", "model"},
            {"created", kModelCreatedTimestamp},
            {"owned_by", "llamacpp"},
            {"meta", {
                {"vocab_type", meta.vocab_type},
                {"n_vocab", meta.n_vocab},
                {"n_ctx_train", meta.n_ctx_train},
                {"n_embd", meta.n_embd},
                {"n_params", meta.n_params},
                {"size", meta.size}
            }}
        });
        models.push_back({
            {"name", def.key},
            {"model", def.key},
            {"type", "model"},
            {"modified_at", ""},
            {"size", ""},
            {"digest", ""},
            {"tags", json::array()},
            {"capabilities", def.capabilities},
            {"details", {
                {"parent_model", ""},
                {"format", "gguf"},
                {"family", ""},
                {"families", json::array()},
                {"parameter_size", ""},
                {"quantization_level", ""}
            }}
        });
    }
    return {{"object", "list"}, {"data", data}, {"models", models}};
}

void OpenAIEndpoints::handleCompletion(const httplib::Request& req, httplib::Response& res) {
    try {
        const std::string model = Gateway::requestedModel(req.body);
        const BackendTarget target = gateway_.ensureBackend(model);
        proxy_.forward(req, res, target);
    } catch (const SwitchError& e) {
        if (httpStatusFor(e.code()) >= 500) {
            spdlog::error("[Gateway] {} {} failed: {}", req.method, req.path, e.what());
        }
        respondError(res, e);
    }
}

void OpenAIEndpoints::registerRoutes(httplib::Server& server) {
    server.Get("/v1/models", [this](const httplib::Request&, httplib::Response& res) {
        setJson(res, listModels());
    });

    auto completion = [this](const httplib::Request& req, httplib::Response& res) {
        handleCompletion(req, res);
    };
    server.Post("/v1/chat/completions", completion);
    server.Post("/v1/completions", completion);
}

}  // namespace lswitch

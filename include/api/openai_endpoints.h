#pragma once

#include <httplib.h>
#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace lswitch {

class ModelConfigStore;
class Gateway;
class StreamProxy;
class SwitchError;

/// Placeholder model metadata reported by /v1/models; the switch never
/// opens the weights itself.
struct ModelMeta {
    int vocab_type{1};
    int64_t n_vocab{32000};
    int64_t n_ctx_train{4096};
    int64_t n_embd{4096};
    int64_t n_params{7000000000};
    int64_t size{4000000000};
};

// Fixed "created" timestamp reported for every configured model.
constexpr int64_t kModelCreatedTimestamp = 1677619200;

class OpenAIEndpoints {
public:
    OpenAIEndpoints(ModelConfigStore& config, Gateway& gateway, StreamProxy& proxy);

    void registerRoutes(httplib::Server& server);

    // {"object":"list","data":[...],"models":[...]} for the current mapping.
    nlohmann::json listModels() const;

    static void setJson(httplib::Response& res, const nlohmann::json& body);
    static void respondError(httplib::Response& res, int status, const std::string& code,
                             const std::string& message);
    // Status from httpStatusFor(), code as the lower-cased error name.
    static void respondError(httplib::Response& res, const SwitchError& error);

private:
    void handleCompletion(const httplib::Request& req, httplib::Response& res);

    ModelConfigStore& config_;
    Gateway& gateway_;
    StreamProxy& proxy_;
};

}  // namespace lswitch

#pragma once

#include <stdexcept>
#include <string>

namespace lswitch {

enum class SwitchErrorCode : int {
    kConfigNotFound = 1,
    kConfigParseError = 2,
    kModelNotFound = 3,
    kSpawnFailure = 4,
    kReadinessTimeout = 5,
    kProxyTransportError = 6,
    kBadRequest = 7,
};

inline const char* to_string(SwitchErrorCode code) {
    switch (code) {
        case SwitchErrorCode::kConfigNotFound:
            return "CONFIG_NOT_FOUND";
        case SwitchErrorCode::kConfigParseError:
            return "CONFIG_PARSE_ERROR";
        case SwitchErrorCode::kModelNotFound:
            return "MODEL_NOT_FOUND";
        case SwitchErrorCode::kSpawnFailure:
            return "SPAWN_FAILURE";
        case SwitchErrorCode::kReadinessTimeout:
            return "READINESS_TIMEOUT";
        case SwitchErrorCode::kProxyTransportError:
            return "PROXY_TRANSPORT_ERROR";
        case SwitchErrorCode::kBadRequest:
            return "BAD_REQUEST";
    }
    return "UNKNOWN";
}

// HTTP status used when an error of this kind reaches a client.
inline int httpStatusFor(SwitchErrorCode code) {
    switch (code) {
        case SwitchErrorCode::kBadRequest:
            return 400;
        case SwitchErrorCode::kModelNotFound:
            return 404;
        case SwitchErrorCode::kReadinessTimeout:
            return 504;
        default:
            return 500;
    }
}

class SwitchError : public std::runtime_error {
public:
    SwitchError(SwitchErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    SwitchErrorCode code() const { return code_; }

private:
    SwitchErrorCode code_;
};

}  // namespace lswitch

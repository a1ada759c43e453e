#pragma once

#include <chrono>

#include <httplib.h>

#include "core/gateway.h"

namespace lswitch {

struct ProxyOptions {
    std::chrono::seconds connect_timeout{10};
    std::chrono::seconds read_timeout{3600};
    std::chrono::seconds write_timeout{3600};
};

/// Forwards one inbound request to a backend and streams the reply back
/// without buffering the whole body.
class StreamProxy {
public:
    explicit StreamProxy(ProxyOptions options = {});

    // Waits for the backend's status line and headers, then installs a
    // chunked provider on `res` that relays the body as it arrives. Throws
    // SwitchError(kProxyTransportError) if no response header arrives.
    void forward(const httplib::Request& req, httplib::Response& res,
                 const BackendTarget& target) const;

    // Inbound headers minus the ones tied to the client connection.
    static httplib::Headers forwardedHeaders(const httplib::Headers& headers);

private:
    ProxyOptions options_;
};

}  // namespace lswitch

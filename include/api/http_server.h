#pragma once

#include <httplib.h>
#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace lswitch {

class OpenAIEndpoints;
class ControlEndpoints;

using Logger = std::function<void(const httplib::Request&, const httplib::Response&)>;

struct CorsPolicy {
    bool enabled{true};
    std::string origin{"*"};
    std::string methods{"GET, POST, OPTIONS"};
    std::string headers{"Content-Type, Authorization"};
};

// Front door of the switch: gateway and control routes, the UI, and the
// cross-cutting headers (CORS, X-Request-Id, traceparent, gzip).
class HttpServer {
public:
    HttpServer(int port, OpenAIEndpoints& openai, ControlEndpoints& control,
               std::string bind_address = "localhost");
    ~HttpServer();

    // Binds and serves on a background thread. Port 0 picks a free port.
    // Throws std::runtime_error if the address cannot be bound.
    void start();
    void stop();
    bool running() const { return running_; }
    int port() const { return port_; }

    void enableCors(bool enable) { cors_.enabled = enable; }
    void setCorsOrigin(std::string origin) { cors_.origin = std::move(origin); }
    void enableCompression(bool enable) { compress_ = enable; }
    void setLogger(Logger logger) { logger_ = std::move(logger); }

    // <ui_dir>/templates/index.html at "/", <ui_dir>/static at "/static".
    void setUiDirectory(std::string ui_dir) { ui_dir_ = std::move(ui_dir); }

private:
    httplib::Server::HandlerResponse preRoute(const httplib::Request& req, httplib::Response& res);
    void postRoute(const httplib::Request& req, httplib::Response& res);
    void installHandlers();
    void mountUi();
    void bindListener();

    int port_;
    std::string bind_address_;
    OpenAIEndpoints& openai_;
    ControlEndpoints& control_;
    httplib::Server server_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    CorsPolicy cors_;
    bool compress_{true};
    std::string ui_dir_;
    Logger logger_{};
};

}  // namespace lswitch

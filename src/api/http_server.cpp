#include "api/http_server.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <zlib.h>

#include "api/control_endpoints.h"
#include "api/openai_endpoints.h"
#include "core/switch_error.h"
#include "utils/request_id.h"

namespace fs = std::filesystem;

namespace lswitch {

namespace {

bool wantsGzip(const httplib::Request& req) {
    std::string enc = req.get_header_value("Accept-Encoding");
    std::transform(enc.begin(), enc.end(), enc.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return enc.find("gzip") != std::string::npos;
}

// Single-shot gzip of a complete body. Empty on any zlib failure.
std::string gzip(const std::string& input) {
    z_stream zs{};
    // windowBits 15 + 16 selects the gzip wrapper.
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return {};
    }
    std::string out(deflateBound(&zs, static_cast<uLong>(input.size())) + 32, '\0');
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());
    zs.next_out = reinterpret_cast<Bytef*>(&out[0]);
    zs.avail_out = static_cast<uInt>(out.size());

    const int rc = deflate(&zs, Z_FINISH);
    out.resize(zs.total_out);
    deflateEnd(&zs);
    return rc == Z_STREAM_END ? out : std::string();
}

void setHeaderIfMissing(httplib::Response& res, const char* name, const std::string& value) {
    if (!res.has_header(name)) res.set_header(name, value);
}

}  // namespace

HttpServer::HttpServer(int port, OpenAIEndpoints& openai, ControlEndpoints& control,
                       std::string bind_address)
    : port_(port), bind_address_(std::move(bind_address)), openai_(openai), control_(control) {}

HttpServer::~HttpServer() { stop(); }

httplib::Server::HandlerResponse HttpServer::preRoute(const httplib::Request& req,
                                                      httplib::Response& res) {
    if (cors_.enabled) {
        setHeaderIfMissing(res, "Access-Control-Allow-Origin", cors_.origin);
        setHeaderIfMissing(res, "Access-Control-Allow-Methods", cors_.methods);
        setHeaderIfMissing(res, "Access-Control-Allow-Headers", cors_.headers);
        if (req.method == "OPTIONS") {
            res.status = 204;
            return httplib::Server::HandlerResponse::Handled;
        }
    }

    const std::string incoming = req.get_header_value("X-Request-Id");
    res.set_header("X-Request-Id", incoming.empty() ? generate_request_id() : incoming);
    res.set_header("traceparent", next_traceparent(req.get_header_value("traceparent")));
    return httplib::Server::HandlerResponse::Unhandled;
}

void HttpServer::postRoute(const httplib::Request& req, httplib::Response& res) {
    if (cors_.enabled) {
        setHeaderIfMissing(res, "Access-Control-Allow-Origin", cors_.origin);
    }
    // Proxied replies are streamed and have no body at this point.
    if (!compress_ || res.body.empty() || res.has_header("Content-Encoding") || !wantsGzip(req)) {
        return;
    }
    std::string packed = gzip(res.body);
    if (packed.empty()) return;

    std::string type = res.get_header_value("Content-Type");
    if (type.empty()) type = "application/octet-stream";
    res.set_content(packed, type);
    res.set_header("Content-Encoding", "gzip");
    res.set_header("Vary", "Accept-Encoding");
}

void HttpServer::installHandlers() {
    server_.set_pre_routing_handler(
        [this](const httplib::Request& req, httplib::Response& res) { return preRoute(req, res); });
    server_.set_post_routing_handler(
        [this](const httplib::Request& req, httplib::Response& res) { postRoute(req, res); });

    if (logger_) {
        server_.set_logger([this](const httplib::Request& req, const httplib::Response& res) {
            logger_(req, res);
        });
    }

    server_.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        // A content type means the handler (or a proxied backend) answered.
        if (res.has_header("Content-Type")) return;
        if (!res.body.empty()) {
            res.set_header("Content-Type", "text/plain");
            return;
        }
        nlohmann::json body = {{"error", res.status == 404 ? "not_found" : "http_error"},
                               {"status", res.status},
                               {"path", req.path}};
        res.set_content(body.dump(), "application/json");
    });

    server_.set_exception_handler(
        [](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            try {
                std::rethrow_exception(ep);
            } catch (const SwitchError& e) {
                spdlog::error("{} {} failed: {}", req.method, req.path, e.what());
                OpenAIEndpoints::respondError(res, e);
            } catch (const std::exception& e) {
                spdlog::error("Unhandled error on {} {}: {}", req.method, req.path, e.what());
                OpenAIEndpoints::respondError(res, 500, "internal_error", e.what());
            }
        });
}

void HttpServer::mountUi() {
    if (ui_dir_.empty()) return;

    const fs::path static_dir = fs::path(ui_dir_) / "static";
    std::error_code ec;
    if (!fs::is_directory(static_dir, ec)) {
        spdlog::warn("UI static directory {} not found; /static disabled", static_dir.string());
    } else if (!server_.set_mount_point("/static", static_dir.string())) {
        spdlog::warn("Cannot mount {} at /static", static_dir.string());
    }

    const fs::path index = fs::path(ui_dir_) / "templates" / "index.html";
    server_.Get("/", [index](const httplib::Request&, httplib::Response& res) {
        std::ifstream in(index, std::ios::binary);
        if (!in) {
            res.status = 404;
            res.set_content("UI not found", "text/plain");
            return;
        }
        std::ostringstream html;
        html << in.rdbuf();
        res.set_content(html.str(), "text/html; charset=utf-8");
    });
}

void HttpServer::bindListener() {
    const int bound = port_ == 0 ? server_.bind_to_any_port(bind_address_)
                                 : (server_.bind_to_port(bind_address_, port_) ? port_ : -1);
    if (bound <= 0) {
        throw std::runtime_error("Cannot bind HTTP server to " + bind_address_ + ":" +
                                 std::to_string(port_));
    }
    port_ = bound;
}

void HttpServer::start() {
    if (running_) return;

    installHandlers();
    openai_.registerRoutes(server_);
    control_.registerRoutes(server_);
    mountUi();
    bindListener();

    running_ = true;
    thread_ = std::thread([this]() { server_.listen_after_bind(); });
    while (!server_.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void HttpServer::stop() {
    if (!running_) return;
    server_.stop();
    if (thread_.joinable()) thread_.join();
    running_ = false;
}

}  // namespace lswitch

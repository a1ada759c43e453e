#include <iostream>
#include <signal.h>
#include <thread>
#include <chrono>
#include <string>
#include <exception>

#include <spdlog/spdlog.h>

#include "api/control_endpoints.h"
#include "api/http_server.h"
#include "api/openai_endpoints.h"
#include "api/stream_proxy.h"
#include "core/gateway.h"
#include "core/process_supervisor.h"
#include "models/model_config.h"
#include "runtime/state.h"
#include "utils/cli.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/version.h"

namespace {

void signalHandler(int) {
    lswitch::request_shutdown();
}

int run_server(const lswitch::ServerConfig& cfg) {
    lswitch::ModelConfigStore config_store(cfg.models_config);
    config_store.reload();

    lswitch::ServiceState state(config_store, cfg.default_ctx, cfg.host);

    lswitch::SupervisorOptions supervisor_options;
    supervisor_options.stop_grace = cfg.stop_grace;
    lswitch::ProcessSupervisor supervisor(state, supervisor_options);

    lswitch::GatewayOptions gateway_options;
    gateway_options.poll_interval = cfg.ready_poll_interval;
    gateway_options.max_attempts = cfg.ready_poll_attempts;
    lswitch::Gateway gateway(supervisor, gateway_options);

    lswitch::ProxyOptions proxy_options;
    proxy_options.connect_timeout = cfg.proxy_connect_timeout;
    proxy_options.read_timeout = cfg.proxy_read_timeout;
    lswitch::StreamProxy proxy(proxy_options);

    lswitch::OpenAIEndpoints openai(config_store, gateway, proxy);
    lswitch::ControlEndpoints control(supervisor, state);

    lswitch::HttpServer server(cfg.port, openai, control, cfg.host);
    server.enableCors(cfg.cors_enabled);
    server.setCorsOrigin(cfg.cors_allow_origin);
    server.enableCompression(cfg.gzip_enabled);
    server.setUiDirectory(cfg.ui_dir);
    server.setLogger([](const httplib::Request& req, const httplib::Response& res) {
        spdlog::info("{} {} {} id={}", req.method, req.path, res.status,
                     res.get_header_value("X-Request-Id"));
    });

    config_store.setOnChange([&supervisor]() {
        spdlog::info("[Config] Models changed; stopping the running backend");
        supervisor.stop();
    });
    if (cfg.watch) {
        config_store.startWatching(cfg.watch_interval);
    }

    try {
        server.start();
    } catch (const std::exception& e) {
        spdlog::critical("Cannot start HTTP server on {}:{}: {}", cfg.host, cfg.port, e.what());
        config_store.stopWatching();
        return 1;
    }
    spdlog::info("llama-switch {} listening on http://{}:{}", LSWITCH_VERSION, cfg.host,
                 server.port());

    while (lswitch::is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    spdlog::info("Shutting down...");
    server.stop();
    config_store.stopWatching();
    supervisor.stop();
    spdlog::info("Shutdown complete");
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto cli_result = lswitch::parseCliArgs(argc, argv);
    if (cli_result.should_exit) {
        (cli_result.exit_code == 0 ? std::cout : std::cerr) << cli_result.output;
        return cli_result.exit_code;
    }

    lswitch::logger::init_from_env();

    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);
    // A client hanging up mid-stream must not kill the process.
    signal(SIGPIPE, SIG_IGN);

    try {
        auto [cfg, sources] = lswitch::loadServerConfigWithLog();
        lswitch::applyServeOptions(cli_result.options, cfg);
        spdlog::info("Config: {}", sources);
        spdlog::info("Models file: {} (watch: {})", cfg.models_config, cfg.watch ? "on" : "off");
        return run_server(cfg);
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}

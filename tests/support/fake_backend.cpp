// Minimal stand-in for llama.cpp's server: prints llama.cpp-style log lines
// and answers the completion endpoints.
//
//   lswitch_fake_backend --port <P> [--host <H>] [--ctx <N>] [--load-ms <N>] [--silent]
//
// --silent never prints a readiness line. Request headers X-Fake-Status: 418
// and X-Fake-Stall-Ms: <N> select an error reply and a stalled stream.
#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <thread>

namespace {

void logLine(const std::string& line) {
    std::cout << line << std::endl;
}

void handleCompletion(const httplib::Request& req, httplib::Response& res) {
    logLine("slot launch_slot_: id  0 | task 1 | processing task");
    logLine("prompt eval time =      40.00 ms /     8 tokens (    5.00 ms per token,   200.00 tokens per second)");
    logLine("       eval time =     100.00 ms /     5 tokens (   20.00 ms per token,    50.00 tokens per second)");
    logLine("slot      release: id  0 | task 1 | stop processing: n_tokens = 13, truncated = 0");

    const bool stream = req.body.find("\"stream\":true") != std::string::npos ||
                        req.body.find("\"stream\": true") != std::string::npos;
    if (stream) {
        // X-Fake-Stall-Ms holds the stream open after the first event.
        const std::string stall_header = req.get_header_value("X-Fake-Stall-Ms");
        const int stall_ms = stall_header.empty() ? 0 : std::atoi(stall_header.c_str());
        res.set_header("X-Fake-Backend", "stream");
        res.set_chunked_content_provider("text/event-stream",
            [stall_ms](size_t, httplib::DataSink& sink) {
                for (int i = 0; i < 3; ++i) {
                    std::string chunk = "data: " + nlohmann::json{{"index", i}}.dump() + "\n\n";
                    if (!sink.write(chunk.data(), chunk.size())) return false;
                    std::this_thread::sleep_for(std::chrono::milliseconds(20));
                    for (int waited = 0; i == 0 && waited < stall_ms; waited += 50) {
                        if (sink.is_writable && !sink.is_writable()) return false;
                        std::this_thread::sleep_for(std::chrono::milliseconds(50));
                    }
                }
                const std::string done = "data: [DONE]\n\n";
                sink.write(done.data(), done.size());
                sink.done();
                return true;
            });
        return;
    }

    if (req.get_header_value("X-Fake-Status") == "418") {
        res.status = 418;
        res.set_content(nlohmann::json{{"error", "teapot"}}.dump(), "application/json");
        return;
    }

    nlohmann::json body = {{"object", "fake.completion"},
                           {"path", req.path},
                           {"method", req.method},
                           {"x_test", req.get_header_value("X-Test")},
                           {"body", req.body}};
    // Echo the decoded prompt so escapes in the request come back as raw bytes.
    auto parsed = nlohmann::json::parse(req.body, nullptr, false);
    if (parsed.is_object() && parsed.contains("prompt")) {
        body["prompt"] = parsed["prompt"];
    }
    res.set_content(body.dump(), "application/json");
}

}  // namespace

int main(int argc, char* argv[]) {
    int port = 0;
    int ctx = 0;
    int load_ms = 0;
    bool silent = false;
    std::string host = "127.0.0.1";

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            port = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
            host = argv[++i];
        } else if (std::strcmp(argv[i], "--ctx") == 0 && i + 1 < argc) {
            ctx = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--load-ms") == 0 && i + 1 < argc) {
            load_ms = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--silent") == 0) {
            silent = true;
        }
    }
    if (port <= 0) {
        std::cerr << "fake_backend: --port is required" << std::endl;
        return 2;
    }
    if (host == "localhost" || host == "0.0.0.0") {
        host = "127.0.0.1";
    }

    logLine("build: fake (llama-switch tests)");
    logLine("llama_context: n_ctx = " + std::to_string(ctx));

    httplib::Server server;
    server.Post("/v1/chat/completions", handleCompletion);
    server.Post("/v1/completions", handleCompletion);
    server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"status":"ok"})", "application/json");
    });

    if (!server.bind_to_port(host, port)) {
        std::cerr << "fake_backend: cannot bind " << host << ":" << port << std::endl;
        return 1;
    }

    std::thread announcer([&server, host, port, load_ms, silent]() {
        while (!server.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(load_ms));
        if (!silent) {
            logLine("main: server is listening on http://" + host + ":" + std::to_string(port));
        }
    });
    server.listen_after_bind();
    announcer.join();
    return 0;
}

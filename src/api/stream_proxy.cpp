#include "api/stream_proxy.h"

#include <algorithm>
#include <array>
#include <chrono>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "core/switch_error.h"

namespace lswitch {

namespace {

// Upper bound on body bytes read from the backend but not yet written to the client.
constexpr size_t kMaxBufferedBytes = 1 << 20;

// How often a provider waiting on a silent backend checks the client is still there.
constexpr std::chrono::milliseconds kClientCheckInterval{200};

constexpr std::array<const char*, 10> kDroppedHeaders = {
    "content-length", "host", "transfer-encoding", "connection", "keep-alive",
    "accept-encoding",
    // Synthesised by httplib for the server side of the connection.
    "remote_addr", "remote_port", "local_addr", "local_port",
};

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

struct ProxyStream {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> chunks;
    size_t buffered{0};
    bool headers_received{false};
    bool done{false};
    bool cancelled{false};
    int status{0};
    std::string content_type;
    std::string error;
    std::unique_ptr<httplib::Client> client;
    std::thread worker;
};

void runUpstream(std::shared_ptr<ProxyStream> st, httplib::Request upstream) {
    upstream.response_handler = [st](const httplib::Response& r) {
        {
            std::lock_guard<std::mutex> lock(st->mutex);
            st->status = r.status;
            st->content_type = r.get_header_value("Content-Type");
            st->headers_received = true;
        }
        st->cv.notify_all();
        return true;
    };
    upstream.content_receiver = [st](const char* data, size_t len, uint64_t, uint64_t) {
        std::unique_lock<std::mutex> lock(st->mutex);
        st->cv.wait(lock, [&st]() { return st->cancelled || st->buffered < kMaxBufferedBytes; });
        if (st->cancelled) {
            return false;
        }
        st->chunks.emplace_back(data, len);
        st->buffered += len;
        lock.unlock();
        st->cv.notify_all();
        return true;
    };

    auto result = st->client->send(upstream);

    {
        std::lock_guard<std::mutex> lock(st->mutex);
        if (!result && !st->cancelled) {
            st->error = httplib::to_string(result.error());
        }
        st->done = true;
    }
    st->cv.notify_all();
}

}  // namespace

StreamProxy::StreamProxy(ProxyOptions options) : options_(options) {}

httplib::Headers StreamProxy::forwardedHeaders(const httplib::Headers& headers) {
    httplib::Headers out;
    for (const auto& [name, value] : headers) {
        const std::string lower = toLower(name);
        const bool dropped = std::any_of(kDroppedHeaders.begin(), kDroppedHeaders.end(),
                                         [&lower](const char* h) { return lower == h; });
        if (!dropped) {
            out.emplace(name, value);
        }
    }
    return out;
}

void StreamProxy::forward(const httplib::Request& req, httplib::Response& res,
                          const BackendTarget& target) const {
    httplib::Request upstream;
    upstream.method = req.method;
    upstream.path = req.path;
    upstream.headers = forwardedHeaders(req.headers);
    upstream.body = req.body;

    auto st = std::make_shared<ProxyStream>();
    st->client = std::make_unique<httplib::Client>(target.host, target.port);
    st->client->set_connection_timeout(static_cast<time_t>(options_.connect_timeout.count()), 0);
    st->client->set_read_timeout(static_cast<time_t>(options_.read_timeout.count()), 0);
    st->client->set_write_timeout(static_cast<time_t>(options_.write_timeout.count()), 0);
    st->worker = std::thread(runUpstream, st, std::move(upstream));

    std::string content_type;
    {
        std::unique_lock<std::mutex> lock(st->mutex);
        st->cv.wait(lock, [&st]() { return st->headers_received || st->done; });
        if (!st->headers_received) {
            const std::string error = st->error.empty() ? "no response" : st->error;
            lock.unlock();
            st->worker.join();
            spdlog::error("[Proxy] {}:{}{} failed: {}", target.host, target.port, req.path, error);
            throw SwitchError(SwitchErrorCode::kProxyTransportError,
                              "Backend request failed: " + error);
        }
        res.status = st->status;
        content_type = st->content_type;
    }

    res.set_chunked_content_provider(
        content_type.empty() ? "application/octet-stream" : content_type,
        [st](size_t, httplib::DataSink& sink) {
            std::unique_lock<std::mutex> lock(st->mutex);
            while (!st->cv.wait_for(lock, kClientCheckInterval,
                                    [&st]() { return !st->chunks.empty() || st->done; })) {
                if (sink.is_writable && !sink.is_writable()) {
                    return false;
                }
            }
            if (st->chunks.empty()) {
                const std::string error = st->error;
                lock.unlock();
                if (!error.empty()) {
                    spdlog::warn("[Proxy] Backend stream ended early: {}", error);
                }
                sink.done();
                return true;
            }
            std::string chunk = std::move(st->chunks.front());
            st->chunks.pop_front();
            st->buffered -= chunk.size();
            lock.unlock();
            st->cv.notify_all();
            return sink.write(chunk.data(), chunk.size());
        },
        [st](bool success) {
            {
                std::lock_guard<std::mutex> lock(st->mutex);
                st->cancelled = true;
            }
            st->cv.notify_all();
            // Unblocks a worker still waiting on the backend socket.
            st->client->stop();
            if (st->worker.joinable()) {
                st->worker.join();
            }
            if (!success) {
                spdlog::info("[Proxy] Client went away before the stream finished");
            }
        });
}

}  // namespace lswitch

#pragma once
#include "http_handler.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace httplib {
    class Server;
}

namespace lrpc::http {

/// Serves one codec/handler pair on a single HTTP path.
class HttpServer {
public:
    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 8080;
        std::string path = "/rpc";
        std::chrono::milliseconds request_timeout{0};
        ErrorCallback on_error;
    };

    HttpServer(Options opts, std::shared_ptr<Codec> codec, std::shared_ptr<Handler> handler);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /// Bind and serve. Blocks until shutdown(); throws TransportError if the
    /// address cannot be bound. Returns at once after shutdown().
    void listen();

    /// Stops a running listen() and prevents later ones. Safe to call from
    /// another thread while listen() is still starting up.
    void shutdown();

    /// True once the server is bound and accepting connections.
    [[nodiscard]] bool is_running() const;

    /// Wait for is_running(); false on timeout or after shutdown().
    bool wait_until_ready(std::chrono::milliseconds timeout) const;

    uint16_t port() const { return opts_.port; }

private:
    Options opts_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> listening_{false};
    std::atomic<bool> stopped_{false};
};

} // namespace lrpc::http

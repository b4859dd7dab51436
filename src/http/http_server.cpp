#include "lrpc/http/http_server.hpp"
#include "lrpc/error.hpp"

#include <httplib.h>

#include <thread>

namespace lrpc::http {

HttpServer::HttpServer(Options opts, std::shared_ptr<Codec> codec, std::shared_ptr<Handler> handler)
    : opts_(std::move(opts))
    , server_(std::make_unique<httplib::Server>()) {
    HttpHandlerOptions handler_opts;
    handler_opts.request_timeout = opts_.request_timeout;
    handler_opts.on_error = opts_.on_error;
    server_->Post(opts_.path, http_handler(std::move(codec), std::move(handler), std::move(handler_opts)));
}

HttpServer::~HttpServer() {
    shutdown();
}

void HttpServer::listen() {
    if (stopped_ || listening_.exchange(true)) return;

    if (!server_->bind_to_port(opts_.host, opts_.port)) {
        listening_ = false;
        throw TransportError("Failed to bind HTTP server on " + opts_.host + ":" + std::to_string(opts_.port));
    }
    // Blocks until stop() is called
    if (!stopped_) {
        server_->listen_after_bind();
    }
    listening_ = false;
}

void HttpServer::shutdown() {
    stopped_ = true;
    // A stop() issued before httplib enters its accept loop is lost.
    while (listening_ && !server_->is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    if (server_->is_running()) server_->stop();
}

bool HttpServer::is_running() const {
    return server_->is_running();
}

bool HttpServer::wait_until_ready(std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!server_->is_running()) {
        if (stopped_ || std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

} // namespace lrpc::http

#pragma once
#include "json2.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace httplib {
    class Client;
}

namespace lrpc::json2 {

/// Issues JSON-RPC 2.0 calls over HTTP POST.
class Client {
public:
    struct Options {
        /// e.g. "http://127.0.0.1:8080/rpc". https:// is rejected with TransportError.
        std::string base_url;
        std::chrono::seconds connection_timeout{10};
        std::chrono::seconds read_timeout{60};
    };

    explicit Client(Options opts);
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    /// Call method and return its result. Throws json2::Error when the
    /// server answers with an error object, TransportError on HTTP failures
    /// or a mismatched id, ParseError on an undecodable response.
    nlohmann::json call(const std::string& method, const nlohmann::json& params);

private:
    Options opts_;
    std::string path_;
    std::unique_ptr<httplib::Client> client_;
};

} // namespace lrpc::json2

#include "lrpc/json2/client.hpp"
#include "lrpc/error.hpp"

#include <httplib.h>

namespace lrpc::json2 {

Client::Client(Options opts)
    : opts_(std::move(opts)) {
    // Support http://host:port/path
    std::string url = opts_.base_url;
    if (url.substr(0, 8) == "https://") {
        throw TransportError("HTTPS is not supported: " + opts_.base_url);
    }
    if (url.substr(0, 7) == "http://") url = url.substr(7);

    auto slash = url.find('/');
    std::string hostport = (slash == std::string::npos) ? url : url.substr(0, slash);
    path_ = (slash == std::string::npos) ? "/" : url.substr(slash);
    if (hostport.empty()) {
        throw TransportError("Invalid base URL: " + opts_.base_url);
    }

    client_ = std::make_unique<httplib::Client>("http://" + hostport);
    client_->set_connection_timeout(opts_.connection_timeout);
    client_->set_read_timeout(opts_.read_timeout);
}

Client::~Client() = default;

nlohmann::json Client::call(const std::string& method, const nlohmann::json& params) {
    Request req = new_request(method, params);

    auto result = client_->Post(path_, encode(req), "application/json");
    if (!result) {
        throw TransportError("HTTP POST failed: " + httplib::to_string(result.error()));
    }
    if (result->status >= 400) {
        throw TransportError("HTTP error " + std::to_string(result->status) + ": " + result->body);
    }

    Response resp = parse_response(result->body);
    if (!req.id || resp.id != *req.id) {
        throw TransportError("Response id " + resp.id.str() + " does not match request");
    }
    if (resp.error) {
        throw *resp.error;
    }
    return resp.result.value_or(nlohmann::json(nullptr));
}

} // namespace lrpc::json2

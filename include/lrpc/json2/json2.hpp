#pragma once
#include "../error.hpp"
#include "../version.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace lrpc::json2 {

/// Identifies errors over JSON-RPC 2.0.
enum class ErrCode : int {
    Parse          = -32700, // invalid JSON received by the server
    InvalidRequest = -32600, // JSON is not a valid Request object
    MethodNotFound = -32601,
    InvalidParams  = -32602,
    Internal       = -32603,
    Server         = -32000, // implementation-defined server error
};

/// JSON-RPC 2.0 error object. Derives from LrpcError so a handler can return
/// it inside a Failure and have it sent verbatim.
class Error : public LrpcError {
public:
    Error(ErrCode code, const std::string& message,
          std::optional<nlohmann::json> data = std::nullopt)
        : LrpcError(message), code_(code), data_(std::move(data)) {}

    /// Accepts codes outside the predefined set, as the protocol allows.
    Error(int code, const std::string& message,
          std::optional<nlohmann::json> data = std::nullopt)
        : Error(static_cast<ErrCode>(code), message, std::move(data)) {}

    [[nodiscard]] ErrCode code() const noexcept { return code_; }
    [[nodiscard]] std::string message() const { return what(); }
    [[nodiscard]] const std::optional<nlohmann::json>& data() const noexcept { return data_; }

    /// Throws ParseError if j is not an error object.
    static Error from_json(const nlohmann::json& j);

    bool operator==(const Error& o) const {
        return code_ == o.code_ && message() == o.message() && data_ == o.data_;
    }
    bool operator!=(const Error& o) const { return !(*this == o); }

private:
    ErrCode code_;
    std::optional<nlohmann::json> data_;
};

void to_json(nlohmann::json& j, const Error& e);

/// Undecoded JSON text, kept byte-for-byte.
class RawMessage {
public:
    /// The JSON literal null.
    RawMessage() : text_("null") {}

    /// text must already be valid JSON; it is not checked.
    explicit RawMessage(std::string text) : text_(std::move(text)) {}

    static RawMessage from_json(const nlohmann::json& j) { return RawMessage(j.dump()); }

    [[nodiscard]] const std::string& str() const noexcept { return text_; }

    /// Throws DecodeError if the text is not valid JSON.
    [[nodiscard]] nlohmann::json parse() const;

    bool operator==(const RawMessage& o) const { return text_ == o.text_; }
    bool operator!=(const RawMessage& o) const { return text_ != o.text_; }

private:
    std::string text_;
};

struct Request {
    std::string version{JSONRPC_VERSION};
    std::string method;
    std::optional<RawMessage> params;
    // String, number or null. Copied as-is, never type checked.
    std::optional<RawMessage> id;
};

struct Response {
    std::string version{JSONRPC_VERSION};
    std::optional<nlohmann::json> result;
    std::optional<Error> error;
    // Must be the id of the request being answered.
    RawMessage id;
};

/// Build an outbound request with a random 16-byte hex id.
[[nodiscard]] Request new_request(const std::string& method, const nlohmann::json& params);

/// 32 lowercase hex characters drawn from std::random_device.
[[nodiscard]] std::string generate_request_id();

/// Parse a request envelope. Throws ParseError on invalid JSON, a non-object
/// body or wrongly typed members. params and id are kept as raw text.
[[nodiscard]] Request parse_request(std::string_view body);

/// Parse a response envelope. Throws ParseError.
[[nodiscard]] Response parse_response(std::string_view body);

[[nodiscard]] std::string encode(const Request& req);

/// Emits error if set, result otherwise; never both.
[[nodiscard]] std::string encode(const Response& resp);

} // namespace lrpc::json2

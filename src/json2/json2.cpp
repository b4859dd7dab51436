#include "lrpc/json2/json2.hpp"
#include <simdjson.h>

#include <functional>
#include <iomanip>
#include <random>
#include <sstream>

namespace lrpc::json2 {

namespace {

void check(simdjson::error_code error, const char* what) {
    if (error) {
        throw ParseError(std::string(what) + ": " + simdjson::error_message(error));
    }
}

std::string_view trim(std::string_view s) {
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

// Raw text of a value; for scalars simdjson includes trailing whitespace.
// raw_json() only skips over the value, so its contents are validated here.
std::string raw_text(simdjson::ondemand::value& val, const char* what) {
    std::string_view raw;
    check(val.raw_json().get(raw), what);
    std::string text(trim(raw));
    if (!nlohmann::json::accept(text)) {
        throw ParseError(std::string(what) + ": malformed JSON value");
    }
    return text;
}

std::string string_member(simdjson::ondemand::value& val, const char* what) {
    std::string_view sv;
    check(val.get_string().get(sv), what);
    return std::string(sv);
}

nlohmann::json parse_value(simdjson::ondemand::value& val, const char* what) {
    try {
        return nlohmann::json::parse(raw_text(val, what));
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(std::string(what) + ": " + e.what());
    }
}

// Walk the members of a top-level JSON object.
void for_each_member(std::string_view body,
                     const std::function<void(std::string_view, simdjson::ondemand::value&)>& fn) {
    if (trim(body).empty()) {
        throw ParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(body.data(), body.size());

    simdjson::ondemand::document doc;
    check(parser.iterate(padded).get(doc), "JSON parse error");

    simdjson::ondemand::object obj;
    check(doc.get_object().get(obj), "Message must be a JSON object");

    for (auto field_result : obj) {
        simdjson::ondemand::field field;
        check(std::move(field_result).get(field), "JSON parse error");
        std::string_view key;
        check(field.unescaped_key().get(key), "JSON parse error");
        // The key view is invalidated once the value is consumed.
        std::string key_copy(key);
        fn(key_copy, field.value());
    }
}

} // anonymous namespace

Error Error::from_json(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("code") || !j.contains("message")) {
        throw ParseError("Error object requires 'code' and 'message'");
    }
    try {
        std::optional<nlohmann::json> data;
        if (j.contains("data") && !j.at("data").is_null()) data = j.at("data");
        return Error(j.at("code").get<int>(), j.at("message").get<std::string>(), std::move(data));
    } catch (const nlohmann::json::exception& e) {
        throw ParseError(std::string("Invalid error object: ") + e.what());
    }
}

void to_json(nlohmann::json& j, const Error& e) {
    j = nlohmann::json{{"code", static_cast<int>(e.code())}, {"message", e.message()}};
    if (e.data()) j["data"] = *e.data();
}

nlohmann::json RawMessage::parse() const {
    try {
        return nlohmann::json::parse(text_);
    } catch (const nlohmann::json::parse_error& e) {
        throw DecodeError(e.what());
    }
}

std::string generate_request_id() {
    std::random_device rd;
    std::uniform_int_distribution<int> byte(0, 255);
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        oss << std::setw(2) << byte(rd);
    }
    return oss.str();
}

Request new_request(const std::string& method, const nlohmann::json& params) {
    Request req;
    req.method = method;
    req.params = RawMessage::from_json(params);
    req.id = RawMessage::from_json(generate_request_id());
    return req;
}

Request parse_request(std::string_view body) {
    Request req;
    req.version.clear();
    for_each_member(body, [&req](std::string_view key, simdjson::ondemand::value& val) {
        if (key == "jsonrpc") {
            req.version = string_member(val, "'jsonrpc' must be a string");
        } else if (key == "method") {
            req.method = string_member(val, "'method' must be a string");
        } else if (key == "params") {
            req.params = RawMessage(raw_text(val, "Invalid 'params'"));
        } else if (key == "id") {
            req.id = RawMessage(raw_text(val, "Invalid 'id'"));
        }
    });
    return req;
}

Response parse_response(std::string_view body) {
    Response resp;
    resp.version.clear();
    for_each_member(body, [&resp](std::string_view key, simdjson::ondemand::value& val) {
        if (key == "jsonrpc") {
            resp.version = string_member(val, "'jsonrpc' must be a string");
        } else if (key == "result") {
            resp.result = parse_value(val, "Invalid 'result'");
        } else if (key == "error") {
            auto j = parse_value(val, "Invalid 'error'");
            if (!j.is_null()) resp.error = Error::from_json(j);
        } else if (key == "id") {
            resp.id = RawMessage(raw_text(val, "Invalid 'id'"));
        }
    });
    if (resp.error) resp.result.reset();
    return resp;
}

std::string encode(const Request& req) {
    std::string out = R"({"jsonrpc":)";
    out += nlohmann::json(req.version).dump();
    out += R"(,"method":)";
    out += nlohmann::json(req.method).dump();
    out += R"(,"params":)";
    out += req.params ? req.params->str() : "null";
    out += R"(,"id":)";
    out += req.id ? req.id->str() : "null";
    out += "}";
    return out;
}

std::string encode(const Response& resp) {
    std::string out = R"({"jsonrpc":)";
    out += nlohmann::json(resp.version).dump();
    if (resp.error) {
        nlohmann::json err;
        to_json(err, *resp.error);
        out += R"(,"error":)";
        out += err.dump();
    } else {
        out += R"(,"result":)";
        out += resp.result ? resp.result->dump() : "null";
    }
    out += R"(,"id":)";
    out += resp.id.str();
    out += "}";
    return out;
}

} // namespace lrpc::json2

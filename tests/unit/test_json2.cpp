#include <gtest/gtest.h>
#include "lrpc/json2/json2.hpp"
#include <cctype>
#include <string>

using namespace lrpc;
using namespace lrpc::json2;

// ---- Error codes ----

TEST(Json2ErrCode, Values) {
    EXPECT_EQ(static_cast<int>(ErrCode::Parse), -32700);
    EXPECT_EQ(static_cast<int>(ErrCode::InvalidRequest), -32600);
    EXPECT_EQ(static_cast<int>(ErrCode::MethodNotFound), -32601);
    EXPECT_EQ(static_cast<int>(ErrCode::InvalidParams), -32602);
    EXPECT_EQ(static_cast<int>(ErrCode::Internal), -32603);
    EXPECT_EQ(static_cast<int>(ErrCode::Server), -32000);
}

TEST(Json2Error, ToJsonOmitsMissingData) {
    nlohmann::json j;
    to_json(j, Error(ErrCode::InvalidParams, "bad params"));
    EXPECT_EQ(j, (nlohmann::json{{"code", -32602}, {"message", "bad params"}}));
    EXPECT_FALSE(j.contains("data"));
}

TEST(Json2Error, FromJson) {
    auto e = Error::from_json({{"code", 1}, {"message", "another error"}, {"data", {{"foo", "bar"}}}});
    EXPECT_EQ(static_cast<int>(e.code()), 1);
    EXPECT_EQ(e.message(), "another error");
    EXPECT_STREQ(e.what(), "another error");
    ASSERT_TRUE(e.data().has_value());
    EXPECT_EQ((*e.data())["foo"], "bar");
}

TEST(Json2Error, FromJsonMissingFields) {
    EXPECT_THROW(Error::from_json({{"code", 1}}), ParseError);
    EXPECT_THROW(Error::from_json("oops"), ParseError);
}

// ---- Request parsing ----

TEST(Json2ParseRequest, Valid) {
    auto req = parse_request(R"({"jsonrpc":"2.0","method":"Echo","params":{"foo":"bar"},"id":"1"})");
    EXPECT_EQ(req.version, "2.0");
    EXPECT_EQ(req.method, "Echo");
    ASSERT_TRUE(req.params.has_value());
    EXPECT_EQ(req.params->str(), R"({"foo":"bar"})");
    ASSERT_TRUE(req.id.has_value());
    EXPECT_EQ(req.id->str(), R"("1")");
}

TEST(Json2ParseRequest, IdKeptVerbatim) {
    EXPECT_EQ(parse_request(R"({"method":"m","id":1.50})").id->str(), "1.50");
    EXPECT_EQ(parse_request(R"({"method":"m","id":  12345678901234567890 })").id->str(), "12345678901234567890");
    EXPECT_EQ(parse_request(R"({"method":"m","id":null})").id->str(), "null");
    EXPECT_EQ(parse_request(R"({"method":"m","id":"abc"})").id->str(), R"("abc")");
}

TEST(Json2ParseRequest, ParamsKeptVerbatim) {
    auto req = parse_request(R"({"method":"m","params":[1, 2,  3],"id":1})");
    EXPECT_EQ(req.params->str(), "[1, 2,  3]");
    EXPECT_EQ(req.params->parse(), nlohmann::json::array({1, 2, 3}));
}

TEST(Json2ParseRequest, OptionalMembers) {
    auto req = parse_request(R"({"method":"notify"})");
    EXPECT_EQ(req.method, "notify");
    EXPECT_FALSE(req.params.has_value());
    EXPECT_FALSE(req.id.has_value());
    EXPECT_TRUE(req.version.empty());
}

TEST(Json2ParseRequest, UnknownMembersIgnored) {
    auto req = parse_request(R"({"method":"m","extra":{"deep":[1,2]},"id":2})");
    EXPECT_EQ(req.method, "m");
    EXPECT_EQ(req.id->str(), "2");
}

TEST(Json2ParseRequest, InvalidJson) {
    EXPECT_THROW(parse_request("{invalid json"), ParseError);
    EXPECT_THROW(parse_request("not json at all"), ParseError);
}

TEST(Json2ParseRequest, EmptyBody) {
    EXPECT_THROW(parse_request(""), ParseError);
    EXPECT_THROW(parse_request("  \n"), ParseError);
}

TEST(Json2ParseRequest, NotAnObject) {
    EXPECT_THROW(parse_request("[1,2,3]"), ParseError);
    EXPECT_THROW(parse_request("42"), ParseError);
}

TEST(Json2ParseRequest, MalformedMemberValues) {
    EXPECT_THROW(parse_request(R"({"jsonrpc":"2.0","method":"Echo","params":"ok","id":tru})"), ParseError);
    EXPECT_THROW(parse_request(R"({"jsonrpc":"2.0","method":"Echo","params":"ok","id":1e})"), ParseError);
    EXPECT_THROW(parse_request(R"({"jsonrpc":"2.0","method":"Echo","params":{"foo":bar},"id":1})"), ParseError);
    EXPECT_THROW(parse_request(R"({"jsonrpc":"2.0","method":"Echo","params":[1,,2],"id":1})"), ParseError);
}

TEST(Json2ParseRequest, WrongMemberTypes) {
    EXPECT_THROW(parse_request(R"({"method":5,"id":1})"), ParseError);
    EXPECT_THROW(parse_request(R"({"jsonrpc":2,"method":"m"})"), ParseError);
}

// ---- Encoding ----

TEST(Json2Encode, SuccessResponse) {
    Response resp;
    resp.result = nlohmann::json{{"foo", "bar"}};
    resp.id = RawMessage(R"("1")");
    EXPECT_EQ(encode(resp), R"({"jsonrpc":"2.0","result":{"foo":"bar"},"id":"1"})");
}

TEST(Json2Encode, ErrorResponse) {
    Response resp;
    resp.error = Error(ErrCode::MethodNotFound, "method not found", nlohmann::json{{"m", "x"}});
    resp.id = RawMessage("7");
    EXPECT_EQ(encode(resp),
              R"({"jsonrpc":"2.0","error":{"code":-32601,"data":{"m":"x"},"message":"method not found"},"id":7})");
}

TEST(Json2Encode, ResultAndErrorAreExclusive) {
    Response resp;
    resp.result = nlohmann::json(1);
    resp.error = Error(ErrCode::Internal, "broken");
    auto j = nlohmann::json::parse(encode(resp));
    EXPECT_TRUE(j.contains("error"));
    EXPECT_FALSE(j.contains("result"));
}

TEST(Json2Encode, NullIdAndResult) {
    Response resp;
    EXPECT_EQ(encode(resp), R"({"jsonrpc":"2.0","result":null,"id":null})");
}

TEST(Json2Encode, RequestRoundTrip) {
    auto req = new_request("Echo", nlohmann::json{{"hello", "world"}});
    auto parsed = parse_request(encode(req));
    EXPECT_EQ(parsed.version, "2.0");
    EXPECT_EQ(parsed.method, "Echo");
    EXPECT_EQ(parsed.params->parse(), (nlohmann::json{{"hello", "world"}}));
    EXPECT_EQ(*parsed.id, *req.id);
}

// ---- new_request ----

TEST(Json2NewRequest, RandomHexId) {
    auto req = new_request("Sum", nlohmann::json::array({1, 2}));
    EXPECT_EQ(req.version, "2.0");
    EXPECT_EQ(req.method, "Sum");
    EXPECT_EQ(req.params->str(), "[1,2]");

    ASSERT_TRUE(req.id.has_value());
    auto id = req.id->parse();
    ASSERT_TRUE(id.is_string());
    auto s = id.get<std::string>();
    ASSERT_EQ(s.size(), 32u);
    for (char c : s) {
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c)) && !std::isupper(static_cast<unsigned char>(c)));
    }
}

TEST(Json2NewRequest, IdsDiffer) {
    EXPECT_NE(generate_request_id(), generate_request_id());
}

// ---- Response parsing ----

TEST(Json2ParseResponse, Result) {
    auto resp = parse_response(R"({"jsonrpc":"2.0","result":{"ok":true},"id":"abc"})");
    ASSERT_TRUE(resp.result.has_value());
    EXPECT_EQ((*resp.result)["ok"], true);
    EXPECT_FALSE(resp.error.has_value());
    EXPECT_EQ(resp.id.str(), R"("abc")");
}

TEST(Json2ParseResponse, Error) {
    auto resp = parse_response(R"({"jsonrpc":"2.0","error":{"code":-32000,"message":"some error","data":null},"id":3})");
    ASSERT_TRUE(resp.error.has_value());
    EXPECT_EQ(resp.error->code(), ErrCode::Server);
    EXPECT_EQ(resp.error->message(), "some error");
    EXPECT_FALSE(resp.error->data().has_value());
    EXPECT_FALSE(resp.result.has_value());
}

TEST(Json2ParseResponse, Invalid) {
    EXPECT_THROW(parse_response("<html>"), ParseError);
    EXPECT_THROW(parse_response(R"({"jsonrpc":"2.0","result":1,"id":tru})"), ParseError);
    EXPECT_THROW(parse_response(R"({"error":{"code":"x"},"id":1})"), ParseError);
}

// ---- RawMessage ----

TEST(RawMessage, DefaultIsNull) {
    RawMessage raw;
    EXPECT_EQ(raw.str(), "null");
    EXPECT_TRUE(raw.parse().is_null());
}

TEST(RawMessage, ParseFailureIsDecodeError) {
    RawMessage raw("{nope");
    EXPECT_THROW((void)raw.parse(), DecodeError);
}

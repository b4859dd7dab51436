#include <gtest/gtest.h>
#include "lrpc/handler.hpp"
#include "lrpc/error.hpp"
#include <memory>
#include <string>

using namespace lrpc;

namespace {

Result echo(Call& call) {
    nlohmann::json in;
    if (auto err = call.unmarshal_args(in)) return *err;
    return nlohmann::json{{"method", call.method()}, {"args", in}};
}

Result constant(const std::string& tag) {
    return nlohmann::json(tag);
}

} // anonymous namespace

TEST(HandlerFunc, AdaptsFunction) {
    HandlerFunc h(echo);
    DirectCall call("Echo", true);
    auto r = h.serve(call);
    ASSERT_FALSE(is_failure(r));
    EXPECT_EQ(std::get<nlohmann::json>(r)["args"], true);
}

TEST(ServeMux, RoutesRegisteredMethods) {
    ServeMux mux;
    mux.handle_func("Echo", echo)
       .handle_func("A", [](Call&) { return constant("a"); })
       .handle("B", std::make_shared<HandlerFunc>([](Call&) { return constant("b"); }));

    DirectCall echo_call("Echo", true);
    auto r = mux.serve(echo_call);
    ASSERT_FALSE(is_failure(r));
    EXPECT_EQ(std::get<nlohmann::json>(r), (nlohmann::json{{"method", "Echo"}, {"args", true}}));

    DirectCall a("A", 0);
    EXPECT_EQ(std::get<nlohmann::json>(mux.serve(a)), "a");
    DirectCall b("B", 0);
    EXPECT_EQ(std::get<nlohmann::json>(mux.serve(b)), "b");
}

TEST(ServeMux, UnknownMethod) {
    ServeMux mux;
    mux.handle_func("Echo", echo);

    DirectCall call("wat", true);
    auto r = mux.serve(call);
    ASSERT_TRUE(is_failure(r));
    const auto& f = std::get<Failure>(r);
    EXPECT_TRUE(f.is<MethodNotFoundError>());
    EXPECT_EQ(f.message(), "method not found");
}

TEST(ServeMux, EmptyMux) {
    ServeMux mux;
    DirectCall call("Missing", nullptr);
    auto r = mux.serve(call);
    ASSERT_TRUE(is_failure(r));
    EXPECT_TRUE(std::get<Failure>(r).is<MethodNotFoundError>());
}

TEST(ServeMux, MatchIsExact) {
    ServeMux mux;
    mux.handle_func("Echo", echo);

    DirectCall lower("echo", 1);
    EXPECT_TRUE(is_failure(mux.serve(lower)));
    DirectCall prefix("Echo.Sub", 1);
    EXPECT_TRUE(is_failure(mux.serve(prefix)));
}

TEST(ServeMux, ReRegistrationOverwrites) {
    ServeMux mux;
    mux.handle_func("M", [](Call&) { return constant("first"); });
    mux.handle_func("M", [](Call&) { return constant("second"); });

    DirectCall call("M", 0);
    EXPECT_EQ(std::get<nlohmann::json>(mux.serve(call)), "second");
}

TEST(ServeMux, HandleReturnsSameMux) {
    ServeMux mux;
    ServeMux& ref = mux.handle_func("M", echo);
    EXPECT_EQ(&ref, &mux);
    EXPECT_TRUE(mux.has_handler("M"));
    EXPECT_FALSE(mux.has_handler("N"));
}

TEST(ServeMux, RejectsNullHandler) {
    ServeMux mux;
    EXPECT_THROW(mux.handle("M", nullptr), std::invalid_argument);
    EXPECT_THROW(mux.handle_func("M", HandlerFunction{}), std::invalid_argument);
}

TEST(ServeMux, HandlerFailuresPassThrough) {
    ServeMux mux;
    mux.handle_func("Fail", [](Call&) -> Result { return Failure(TransportError("downstream")); });

    DirectCall call("Fail", 0);
    auto r = mux.serve(call);
    ASSERT_TRUE(is_failure(r));
    EXPECT_TRUE(std::get<Failure>(r).is<TransportError>());
    EXPECT_EQ(std::get<Failure>(r).message(), "downstream");
}

TEST(ServeMux, NestedMuxes) {
    auto inner = std::make_shared<ServeMux>();
    inner->handle_func("Echo", echo);
    ServeMux outer;
    outer.handle("Echo", inner);

    DirectCall call("Echo", 7);
    auto r = outer.serve(call);
    ASSERT_FALSE(is_failure(r));
    EXPECT_EQ(std::get<nlohmann::json>(r)["args"], 7);
}

#include <benchmark/benchmark.h>
#include "lrpc/handler.hpp"
#include "lrpc/json2/codec.hpp"

#include <httplib.h>

#include <memory>
#include <string>

using namespace lrpc;

// Create a mux with N methods registered
static std::shared_ptr<ServeMux> make_mux(int n_methods) {
    auto mux = std::make_shared<ServeMux>();
    for (int i = 0; i < n_methods; ++i) {
        mux->handle_func("method_" + std::to_string(i), [](Call&) -> Result {
            return nlohmann::json{{"result", "ok"}};
        });
    }
    mux->handle_func("Echo", [](Call& c) -> Result {
        nlohmann::json in;
        if (auto err = c.unmarshal_args(in)) return *err;
        return in;
    });
    return mux;
}

static void BM_DispatchKnownMethod(benchmark::State& state) {
    auto mux = make_mux(static_cast<int>(state.range(0)));

    for (auto _ : state) {
        DirectCall call("Echo", 1);
        auto r = mux->serve(call);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_DispatchKnownMethod)->Arg(1)->Arg(100)->Arg(1000);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    auto mux = make_mux(1);

    for (auto _ : state) {
        DirectCall call("not_registered_method", 1);
        auto r = mux->serve(call);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_DispatchUnknownMethod)->MinTime(1.0);

// Full HTTP bridge path without sockets: parse, dispatch, encode.
static void BM_Json2Exchange(benchmark::State& state) {
    auto handler = http::http_handler(std::make_shared<json2::Codec>(), make_mux(10));

    httplib::Request req;
    req.method = "POST";
    req.path = "/rpc";
    req.body = R"({"jsonrpc":"2.0","method":"Echo","params":{"foo":"bar"},"id":"1"})";

    for (auto _ : state) {
        httplib::Response res;
        handler(req, res);
        benchmark::DoNotOptimize(res.body);
    }
}
BENCHMARK(BM_Json2Exchange)->MinTime(1.0);

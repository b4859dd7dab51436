#include <benchmark/benchmark.h>
#include "lrpc/json2/json2.hpp"
#include <string>

using namespace lrpc;
using namespace lrpc::json2;

// Small message (~80 bytes)
static const std::string kSmallRequest =
    R"({"jsonrpc":"2.0","method":"Echo","params":{"foo":"bar"},"id":"1"})";

// Request carrying a large params payload
static std::string make_large_request(int n) {
    nlohmann::json items = nlohmann::json::array();
    for (int i = 0; i < n; ++i) {
        items.push_back({
            {"name", "item_" + std::to_string(i)},
            {"description", "A parameter entry, number " + std::to_string(i)},
            {"tags", {"alpha", "beta", "gamma"}},
            {"weight", i * 0.5}
        });
    }
    nlohmann::json req = {
        {"jsonrpc", "2.0"},
        {"method", "Store.Put"},
        {"params", {{"items", items}}},
        {"id", 1}
    };
    return req.dump();
}

static const std::string kLargeRequest = make_large_request(100);

// ---- Parse benchmarks ----

static void BM_ParseSmallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto req = parse_request(kSmallRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kSmallRequest.size());
}
BENCHMARK(BM_ParseSmallRequest)->MinTime(1.0);

static void BM_ParseLargeRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto req = parse_request(kLargeRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kLargeRequest.size());
}
BENCHMARK(BM_ParseLargeRequest)->MinTime(1.0);

static void BM_ParseAndDecodeParams(benchmark::State& state) {
    for (auto _ : state) {
        auto req = parse_request(kLargeRequest);
        auto params = req.params->parse();
        benchmark::DoNotOptimize(params);
    }
    state.SetBytesProcessed(state.iterations() * kLargeRequest.size());
}
BENCHMARK(BM_ParseAndDecodeParams)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto req = parse_request(bad);
            benchmark::DoNotOptimize(req);
        } catch (const ParseError&) {}
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

// ---- Encode benchmarks ----

static void BM_EncodeResultResponse(benchmark::State& state) {
    Response resp;
    resp.result = nlohmann::json{{"foo", "bar"}};
    resp.id = RawMessage(R"("1")");

    for (auto _ : state) {
        auto s = encode(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_EncodeResultResponse)->MinTime(1.0);

static void BM_EncodeErrorResponse(benchmark::State& state) {
    Response resp;
    resp.error = Error(ErrCode::Server, "some error");
    resp.id = RawMessage("42");

    for (auto _ : state) {
        auto s = encode(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_EncodeErrorResponse)->MinTime(1.0);

static void BM_NewRequest(benchmark::State& state) {
    const nlohmann::json params = {{"foo", "bar"}};
    for (auto _ : state) {
        auto s = encode(new_request("Echo", params));
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_NewRequest)->MinTime(1.0);

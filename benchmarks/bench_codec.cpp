#include <benchmark/benchmark.h>
#include "mcp_echo/codec.hpp"
#include "mcp_echo/error.hpp"
#include "mcp_echo/json_rpc.hpp"
#include <string>

using namespace mcp_echo;

static const std::string kPingRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"ping","params":{}})";

static const std::string kEchoRequest =
    R"({"jsonrpc":"2.0","id":42,"method":"tools/call","params":{"name":"echo","arguments":{"message":"hello from the benchmark"}}})";

// tools/call request whose message is `n` bytes of text with escapes
static std::string make_echo_request(size_t n) {
    std::string message;
    message.reserve(n);
    while (message.size() < n) {
        message += "line \"quoted\"\n";
    }
    message.resize(n);
    nlohmann::json req = {
        {"jsonrpc", "2.0"},
        {"id", "large"},
        {"method", "tools/call"},
        {"params", {{"name", "echo"}, {"arguments", {{"message", message}}}}}
    };
    return req.dump();
}

// ---- Parse benchmarks ----

static void BM_ParsePing(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse(kPingRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kPingRequest.size());
}
BENCHMARK(BM_ParsePing)->MinTime(1.0);

static void BM_ParseEchoCall(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse(kEchoRequest);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * kEchoRequest.size());
}
BENCHMARK(BM_ParseEchoCall)->MinTime(1.0);

static void BM_ParseLargeEchoCall(benchmark::State& state) {
    const std::string raw = make_echo_request(static_cast<size_t>(state.range(0)));
    for (auto _ : state) {
        auto req = Codec::parse(raw);
        benchmark::DoNotOptimize(req);
    }
    state.SetBytesProcessed(state.iterations() * raw.size());
}
BENCHMARK(BM_ParseLargeEchoCall)->Range(1 << 10, 1 << 20)->MinTime(1.0);

static void BM_ParseInvalidJson(benchmark::State& state) {
    const std::string bad = "{this is not valid json at all!!!";
    for (auto _ : state) {
        try {
            auto req = Codec::parse(bad);
            benchmark::DoNotOptimize(req);
        } catch (const ParseError& e) {
            benchmark::DoNotOptimize(e);
        }
    }
}
BENCHMARK(BM_ParseInvalidJson)->MinTime(1.0);

// ---- Serialize benchmarks ----

static void BM_SerializeEmptyResult(benchmark::State& state) {
    auto resp = JsonRpcResponse::success(RequestId{int64_t{1}}, nlohmann::json::object());
    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_SerializeEmptyResult)->MinTime(1.0);

static void BM_SerializeEchoResult(benchmark::State& state) {
    const std::string text(static_cast<size_t>(state.range(0)), 'x');
    auto resp = JsonRpcResponse::success(
        RequestId{std::string("large")},
        nlohmann::json{{"content", {{{"type", "text"}, {"text", text}}}}});
    for (auto _ : state) {
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(text.size()));
}
BENCHMARK(BM_SerializeEchoResult)->Range(1 << 10, 1 << 20)->MinTime(1.0);

static void BM_ParseThenSerialize(benchmark::State& state) {
    for (auto _ : state) {
        auto req = Codec::parse(kEchoRequest);
        auto resp = JsonRpcResponse::success(req.id, req.params.value_or(nlohmann::json::object()));
        auto s = Codec::serialize(resp);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_ParseThenSerialize)->MinTime(1.0);

#include <benchmark/benchmark.h>
#include "mcp_echo/router.hpp"
#include "mcp_echo/server.hpp"
#include <string>
#include <vector>

using namespace mcp_echo;

static Router make_router(int n_methods) {
    Router router;
    for (int i = 0; i < n_methods; ++i) {
        router.on_request("method_" + std::to_string(i),
            [](const nlohmann::json&) -> HandlerResult {
                return nlohmann::json{{"result", "ok"}};
            });
    }
    router.on_request("ping", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json::object();
    });
    return router;
}

static void BM_DispatchKnownMethod(benchmark::State& state) {
    auto router = make_router(1);

    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "ping";

    for (auto _ : state) {
        auto resp = router.dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchKnownMethod)->MinTime(1.0);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    auto router = make_router(1);

    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "not_registered_method";

    for (auto _ : state) {
        auto resp = router.dispatch(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_DispatchUnknownMethod)->MinTime(1.0);

static void BM_Dispatch100Methods(benchmark::State& state) {
    auto router = make_router(100);

    std::vector<JsonRpcRequest> requests;
    for (int i = 0; i < 100; ++i) {
        JsonRpcRequest req;
        req.id = RequestId{int64_t{i}};
        req.method = "method_" + std::to_string(i);
        requests.push_back(req);
    }

    size_t i = 0;
    for (auto _ : state) {
        auto resp = router.dispatch(requests[i % requests.size()]);
        benchmark::DoNotOptimize(resp);
        ++i;
    }
}
BENCHMARK(BM_Dispatch100Methods)->MinTime(1.0);

static void BM_ServerEchoCall(benchmark::State& state) {
    EchoServer server{EchoServer::Options{}};

    JsonRpcRequest req;
    req.id = RequestId{int64_t{7}};
    req.method = "tools/call";
    req.params = nlohmann::json{{"name", "echo"},
                                {"arguments", {{"message", "benchmark payload"}}}};

    for (auto _ : state) {
        auto resp = server.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_ServerEchoCall)->MinTime(1.0);

static void BM_ServerToolsList(benchmark::State& state) {
    EchoServer server{EchoServer::Options{}};

    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "tools/list";

    for (auto _ : state) {
        auto resp = server.handle(req);
        benchmark::DoNotOptimize(resp);
    }
}
BENCHMARK(BM_ServerToolsList)->MinTime(1.0);

#include <benchmark/benchmark.h>
#include "mcp_echo/server.hpp"
#include "mcp_echo/transport/stream_transport.hpp"
#include <sstream>
#include <string>

using namespace mcp_echo;

// `n` echo calls, one per line
static std::string make_script(int64_t n) {
    std::string script;
    for (int64_t i = 0; i < n; ++i) {
        script += R"({"jsonrpc":"2.0","id":)" + std::to_string(i)
                + R"(,"method":"tools/call","params":{"name":"echo","arguments":{"message":"msg )"
                + std::to_string(i) + "\"}}}\n";
    }
    return script;
}

static void BM_MessageCycleThroughput(benchmark::State& state) {
    const std::string script = make_script(state.range(0));
    EchoServer server{EchoServer::Options{}};

    for (auto _ : state) {
        std::istringstream in(script);
        std::ostringstream out;
        StreamTransport transport(in, out);
        auto processed = server.serve(transport);
        benchmark::DoNotOptimize(processed);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(script.size()));
}
BENCHMARK(BM_MessageCycleThroughput)->Arg(100)->Arg(1000)->Arg(10000)
    ->Unit(benchmark::kMillisecond);

/// Echo server: one "echo" tool over newline-delimited JSON-RPC on stdio.
/// Usage: ./mcp_echo_server
/// Diagnostics go to stderr; set MCP_ECHO_LOG_LEVEL=debug for per-message logs.

#include <mcp_echo/mcp_echo.hpp>
#include <csignal>
#include <cstdlib>
#include <exception>

namespace {

void configure_logging() {
    const char* env = std::getenv("MCP_ECHO_LOG_LEVEL");
    if (env == nullptr || *env == '\0') return;

    if (auto lvl = mcp_echo::logger::level_from_string(env)) {
        mcp_echo::logger::set_level(*lvl);
    } else {
        MCP_ECHO_LOG_WARN("main", "unknown MCP_ECHO_LOG_LEVEL '{}', using info", env);
    }
}

} // anonymous namespace

int main() {
    // A vanished peer must surface as EPIPE on write, not kill the process.
    std::signal(SIGPIPE, SIG_IGN);

    try {
        configure_logging();

        mcp_echo::EchoServer server{mcp_echo::EchoServer::Options{}};

        // Serve over stdio, blocks until stdin is closed
        server.serve_stdio();
    } catch (const std::exception& e) {
        MCP_ECHO_LOG_ERROR("main", "startup failed: {}", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}

#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "session.hpp"
#include "transport/transport.hpp"
#include "version.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace mcp_echo {

class EchoServer {
public:
    struct Options {
        Implementation server_info{std::string(SERVER_NAME), std::string(SERVER_VERSION)};
        std::string protocol_version{PROTOCOL_VERSION};
        size_t max_line_bytes = kDefaultMaxLineBytes;
    };

    /// Builds the routing table and registers the echo tool.
    explicit EchoServer(Options opts);
    ~EchoServer();

    // Non-copyable, non-movable
    EchoServer(const EchoServer&) = delete;
    EchoServer& operator=(const EchoServer&) = delete;

    /// Run the message loop on `transport` until its input ends.
    /// Returns the number of requests answered.
    uint64_t serve(ITransport& transport);
    uint64_t serve(std::unique_ptr<ITransport> transport);
    uint64_t serve_stdio();

    /// Dispatch a single request without any transport.
    [[nodiscard]] JsonRpcResponse handle(const JsonRpcRequest& request);

    [[nodiscard]] bool is_running() const noexcept;
    [[nodiscard]] bool is_initialized() const noexcept;
    [[nodiscard]] const Session& session() const noexcept;
    [[nodiscard]] const Options& options() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace mcp_echo

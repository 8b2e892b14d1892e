#pragma once
#include "transport.hpp"
#include "../json_rpc.hpp"
#include <cstdint>

namespace mcp_echo {

/// Writes one response per line and flushes. Best effort: failures are
/// logged and counted, never thrown, since a lost response cannot be
/// retried without a fresh request.
class FramedWriter {
public:
    explicit FramedWriter(ITransport& transport);

    /// Returns false if the response could not be serialized or written.
    bool write(const JsonRpcResponse& response) noexcept;

    uint64_t responses_written() const noexcept { return written_; }
    uint64_t write_failures() const noexcept { return failures_; }

private:
    ITransport& transport_;
    uint64_t written_{0};
    uint64_t failures_{0};
};

} // namespace mcp_echo

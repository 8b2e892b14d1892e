#pragma once
#include "transport.hpp"
#include "../json_rpc.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace mcp_echo {

enum class ReadStatus {
    Message,      // a request was decoded
    Skipped,      // blank, oversized or undecodable line; keep reading
    EndOfStream   // input closed (or failed); stop
};

struct ReadResult {
    ReadStatus status;
    std::optional<JsonRpcRequest> request;  // set only for Message
    std::string reason;                     // why a line was skipped
};

/// Pulls one line from the transport and decodes it. Keeps "the stream is
/// gone" and "this one line was bad" apart so the caller can stop on the
/// former and carry on after the latter.
class FramedReader {
public:
    explicit FramedReader(ITransport& transport);

    /// Blocks until a line arrives or the stream ends. Never throws.
    [[nodiscard]] ReadResult next();

    uint64_t lines_read() const noexcept { return lines_read_; }
    uint64_t lines_skipped() const noexcept { return lines_skipped_; }

private:
    ReadResult skip(std::string reason);

    ITransport& transport_;
    uint64_t lines_read_{0};
    uint64_t lines_skipped_{0};
};

} // namespace mcp_echo

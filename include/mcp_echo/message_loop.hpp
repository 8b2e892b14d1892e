#pragma once
#include "router.hpp"
#include "transport/framed_reader.hpp"
#include "transport/framed_writer.hpp"
#include <cstdint>
#include <string_view>

namespace mcp_echo {

enum class LoopState {
    WaitingForMessage,
    Processing,
    Responding,
    Stopped
};

std::string_view to_string(LoopState state);

/// Strictly sequential read -> dispatch -> write cycle. The response for a
/// request is fully written before the next line is read, so output order
/// always equals input order. The loop is the sole user of the reader and
/// writer while it runs.
class MessageLoop {
public:
    MessageLoop(FramedReader& reader, FramedWriter& writer, const Router& router);

    /// Run cycles until the input ends. Returns the number of requests
    /// answered.
    uint64_t run();

    /// Run one cycle: read one line and, if it held a request, dispatch it
    /// and write the response. Returns false once the loop has stopped.
    bool step();

    LoopState state() const noexcept { return state_; }
    uint64_t requests_processed() const noexcept { return processed_; }

private:
    FramedReader& reader_;
    FramedWriter& writer_;
    const Router& router_;
    LoopState state_{LoopState::WaitingForMessage};
    uint64_t processed_{0};
};

} // namespace mcp_echo

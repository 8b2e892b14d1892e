#include "mcp_echo/message_loop.hpp"
#include "mcp_echo/logger.hpp"

namespace mcp_echo {

std::string_view to_string(LoopState state) {
    switch (state) {
        case LoopState::WaitingForMessage: return "waiting";
        case LoopState::Processing:        return "processing";
        case LoopState::Responding:        return "responding";
        case LoopState::Stopped:           return "stopped";
    }
    return "unknown";
}

MessageLoop::MessageLoop(FramedReader& reader, FramedWriter& writer, const Router& router)
    : reader_(reader), writer_(writer), router_(router) {
}

bool MessageLoop::step() {
    if (state_ == LoopState::Stopped) return false;

    state_ = LoopState::WaitingForMessage;
    ReadResult read = reader_.next();
    switch (read.status) {
        case ReadStatus::EndOfStream:
            state_ = LoopState::Stopped;
            return false;
        case ReadStatus::Skipped:
            return true;
        case ReadStatus::Message:
            break;
    }

    state_ = LoopState::Processing;
    JsonRpcResponse response = router_.dispatch(*read.request);

    state_ = LoopState::Responding;
    writer_.write(response);
    ++processed_;

    state_ = LoopState::WaitingForMessage;
    return true;
}

uint64_t MessageLoop::run() {
    MCP_ECHO_LOG_DEBUG("loop", "message loop started");
    while (step()) {
    }
    MCP_ECHO_LOG_INFO("loop", "input closed: {} requests answered, {} lines skipped, "
                      "{} write failures", processed_, reader_.lines_skipped(),
                      writer_.write_failures());
    return processed_;
}

} // namespace mcp_echo

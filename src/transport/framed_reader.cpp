#include "mcp_echo/transport/framed_reader.hpp"
#include "mcp_echo/codec.hpp"
#include "mcp_echo/error.hpp"
#include "mcp_echo/logger.hpp"
#include <algorithm>
#include <cctype>

namespace mcp_echo {

namespace {

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // anonymous namespace

FramedReader::FramedReader(ITransport& transport)
    : transport_(transport) {
}

ReadResult FramedReader::skip(std::string reason) {
    ++lines_skipped_;
    MCP_ECHO_LOG_WARN("reader", "skipping line {}: {}", lines_read_, reason);
    return ReadResult{ReadStatus::Skipped, std::nullopt, std::move(reason)};
}

ReadResult FramedReader::next() {
    std::optional<std::string> line;
    try {
        line = transport_.read_line();
    } catch (const FrameTooLargeError& e) {
        ++lines_read_;
        return skip(e.what());
    } catch (const std::exception& e) {
        MCP_ECHO_LOG_ERROR("reader", "input stream failed: {}", e.what());
        return ReadResult{ReadStatus::EndOfStream, std::nullopt, e.what()};
    }

    if (!line) {
        MCP_ECHO_LOG_DEBUG("reader", "end of input after {} lines", lines_read_);
        return ReadResult{ReadStatus::EndOfStream, std::nullopt, {}};
    }
    ++lines_read_;

    if (is_blank(*line)) {
        ++lines_skipped_;
        MCP_ECHO_LOG_DEBUG("reader", "ignoring blank line {}", lines_read_);
        return ReadResult{ReadStatus::Skipped, std::nullopt, "blank line"};
    }

    try {
        auto req = Codec::parse(*line);
        MCP_ECHO_LOG_DEBUG("reader", "read id={} method={}", to_string(req.id), req.method);
        return ReadResult{ReadStatus::Message, std::move(req), {}};
    } catch (const ParseError& e) {
        return skip(e.what());
    }
}

} // namespace mcp_echo

#include "mcp_echo/transport/framed_writer.hpp"
#include "mcp_echo/codec.hpp"
#include "mcp_echo/logger.hpp"
#include <exception>

namespace mcp_echo {

FramedWriter::FramedWriter(ITransport& transport)
    : transport_(transport) {
}

bool FramedWriter::write(const JsonRpcResponse& response) noexcept {
    try {
        transport_.write_line(Codec::serialize(response));
        ++written_;
        MCP_ECHO_LOG_DEBUG("writer", "wrote id={} error={}", to_string(response.id),
                           response.error.has_value());
        return true;
    } catch (const std::exception& e) {
        ++failures_;
        try {
            MCP_ECHO_LOG_ERROR("writer", "failed to write id={}: {}", to_string(response.id),
                               e.what());
        } catch (const std::exception&) {
            // stderr itself is unusable; nothing left to report to
        }
        return false;
    }
}

} // namespace mcp_echo

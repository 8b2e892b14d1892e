#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace mcp_echo {

constexpr size_t kDefaultMaxLineBytes = 4 * 1024 * 1024;

/// Blocking, newline-framed byte stream.
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Block until one complete line is available and return it without
    /// its line terminator ("\n" or "\r\n"). A final unterminated line is
    /// returned as-is. Returns std::nullopt once the stream has ended.
    /// Throws FrameTooLargeError for an oversized line (already discarded)
    /// and TransportError on any other read failure.
    virtual std::optional<std::string> read_line() = 0;

    /// Write `line` followed by exactly one '\n' and flush.
    /// Throws TransportError on failure.
    virtual void write_line(std::string_view line) = 0;

    /// Stop reading; later read_line() calls report end of stream.
    virtual void shutdown() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;
};

} // namespace mcp_echo

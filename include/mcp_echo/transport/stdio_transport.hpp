#pragma once
#include "transport.hpp"
#include <string>

namespace mcp_echo {

/// Newline-delimited transport over POSIX file descriptors, stdin/stdout by
/// default. Reads are buffered; writes go straight to write(2).
class StdioTransport : public ITransport {
public:
    /// Create transport using system stdin/stdout.
    explicit StdioTransport(size_t max_line_bytes = kDefaultMaxLineBytes);

    /// Create transport using specified file descriptors, which it then
    /// owns and closes (for testing).
    StdioTransport(int read_fd, int write_fd, size_t max_line_bytes = kDefaultMaxLineBytes);

    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    std::optional<std::string> read_line() override;
    void write_line(std::string_view line) override;
    void shutdown() override;
    bool is_connected() const override;

private:
    /// Read more bytes into buffer_. Returns false at EOF.
    bool fill_buffer();

    int read_fd_;
    int write_fd_;
    bool owns_fds_;
    size_t max_line_bytes_;

    bool connected_{true};
    bool eof_{false};
    bool discarding_{false};  // inside an oversized line, dropping until '\n'

    std::string buffer_;
    size_t scan_pos_{0};
};

} // namespace mcp_echo

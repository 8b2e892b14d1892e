#include "mcp_echo/transport/stdio_transport.hpp"
#include "mcp_echo/error.hpp"
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace mcp_echo {

StdioTransport::StdioTransport(size_t max_line_bytes)
    : read_fd_(STDIN_FILENO), write_fd_(STDOUT_FILENO), owns_fds_(false),
      max_line_bytes_(max_line_bytes) {
    buffer_.reserve(4096);
}

StdioTransport::StdioTransport(int read_fd, int write_fd, size_t max_line_bytes)
    : read_fd_(read_fd), write_fd_(write_fd), owns_fds_(true),
      max_line_bytes_(max_line_bytes) {
    buffer_.reserve(4096);
}

StdioTransport::~StdioTransport() {
    if (owns_fds_) {
        if (read_fd_ >= 0)  ::close(read_fd_);
        if (write_fd_ >= 0 && write_fd_ != read_fd_) ::close(write_fd_);
    }
}

bool StdioTransport::fill_buffer() {
    char chunk[4096];
    while (true) {
        ssize_t n = ::read(read_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("Read error: ") + std::strerror(errno));
        }
        if (n == 0) {
            eof_ = true;
            return false;
        }
        buffer_.append(chunk, static_cast<size_t>(n));
        return true;
    }
}

std::optional<std::string> StdioTransport::read_line() {
    while (connected_) {
        size_t nl = buffer_.find('\n', scan_pos_);
        if (nl != std::string::npos) {
            if (discarding_ || nl > max_line_bytes_) {
                buffer_.erase(0, nl + 1);
                scan_pos_ = 0;
                discarding_ = false;
                throw FrameTooLargeError("Input line exceeds " + std::to_string(max_line_bytes_)
                                         + " bytes, discarded");
            }
            std::string line = buffer_.substr(0, nl);
            buffer_.erase(0, nl + 1);
            scan_pos_ = 0;
            // Remove trailing \r if present (CRLF)
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return line;
        }
        scan_pos_ = buffer_.size();

        if (buffer_.size() > max_line_bytes_) {
            // Keep memory bounded: drop what we have, skip to the next '\n'.
            discarding_ = true;
            buffer_.clear();
            scan_pos_ = 0;
        }

        if (eof_ || !fill_buffer()) {
            connected_ = false;
            if (discarding_ || buffer_.empty()) {
                return std::nullopt;
            }
            std::string line = std::move(buffer_);
            buffer_.clear();
            scan_pos_ = 0;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return line;
        }
    }
    return std::nullopt;
}

void StdioTransport::write_line(std::string_view line) {
    std::string framed;
    framed.reserve(line.size() + 1);
    framed.append(line);
    framed += '\n';

    const char* data = framed.data();
    size_t remaining = framed.size();
    while (remaining > 0) {
        ssize_t written = ::write(write_fd_, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            throw TransportError(std::string("Write error: ") + std::strerror(errno));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
}

void StdioTransport::shutdown() {
    connected_ = false;
}

bool StdioTransport::is_connected() const {
    return connected_;
}

} // namespace mcp_echo

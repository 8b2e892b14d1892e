#include "mcp_echo/transport/stream_transport.hpp"
#include "mcp_echo/error.hpp"
#include <string>

namespace mcp_echo {

StreamTransport::StreamTransport(std::istream& in, std::ostream& out, size_t max_line_bytes)
    : in_(in), out_(out), max_line_bytes_(max_line_bytes) {
}

std::optional<std::string> StreamTransport::read_line() {
    if (!connected_) return std::nullopt;

    std::string line;
    if (!std::getline(in_, line)) {
        if (in_.bad()) {
            connected_ = false;
            throw TransportError("Read error on input stream");
        }
        connected_ = false;
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    if (line.size() > max_line_bytes_) {
        throw FrameTooLargeError("Input line exceeds " + std::to_string(max_line_bytes_)
                                 + " bytes, discarded");
    }
    return line;
}

void StreamTransport::write_line(std::string_view line) {
    out_.write(line.data(), static_cast<std::streamsize>(line.size()));
    out_.put('\n');
    out_.flush();
    if (!out_) {
        throw TransportError("Write error on output stream");
    }
}

void StreamTransport::shutdown() {
    connected_ = false;
}

bool StreamTransport::is_connected() const {
    return connected_;
}

} // namespace mcp_echo

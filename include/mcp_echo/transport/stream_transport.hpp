#pragma once
#include "transport.hpp"
#include <istream>
#include <ostream>

namespace mcp_echo {

/// Newline-delimited transport over iostreams. The streams are borrowed
/// and must outlive the transport.
class StreamTransport : public ITransport {
public:
    StreamTransport(std::istream& in, std::ostream& out,
                    size_t max_line_bytes = kDefaultMaxLineBytes);

    std::optional<std::string> read_line() override;
    void write_line(std::string_view line) override;
    void shutdown() override;
    bool is_connected() const override;

private:
    std::istream& in_;
    std::ostream& out_;
    size_t max_line_bytes_;
    bool connected_{true};
};

} // namespace mcp_echo

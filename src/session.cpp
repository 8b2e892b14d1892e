#include "mcp_echo/session.hpp"

namespace mcp_echo {

void Session::mark_initialized(std::optional<Implementation> client_info,
                               std::optional<std::string> client_protocol_version) {
    state_ = SessionState::Ready;
    client_info_ = std::move(client_info);
    client_protocol_version_ = std::move(client_protocol_version);
    ++initialize_count_;
}

} // namespace mcp_echo

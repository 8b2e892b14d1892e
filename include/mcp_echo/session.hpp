#pragma once
#include "types.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace mcp_echo {

enum class SessionState {
    Uninitialized,
    Ready
};

/// Per-connection state. Only "initialized" changes after startup, and it
/// is diagnostic: requests are served whether or not it is set.
class Session {
public:
    SessionState state() const noexcept { return state_; }
    bool initialized() const noexcept { return state_ == SessionState::Ready; }

    /// Record an initialize call. Repeated calls overwrite the client info.
    void mark_initialized(std::optional<Implementation> client_info,
                          std::optional<std::string> client_protocol_version);

    const std::optional<Implementation>& client_info() const noexcept { return client_info_; }
    const std::optional<std::string>& client_protocol_version() const noexcept {
        return client_protocol_version_;
    }
    uint64_t initialize_count() const noexcept { return initialize_count_; }

private:
    SessionState state_{SessionState::Uninitialized};
    std::optional<Implementation> client_info_;
    std::optional<std::string> client_protocol_version_;
    uint64_t initialize_count_{0};
};

} // namespace mcp_echo

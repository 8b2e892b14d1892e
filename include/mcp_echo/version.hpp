#pragma once
#include <string_view>

namespace mcp_echo {

constexpr std::string_view SERVER_NAME         = "echo-server";
constexpr std::string_view SERVER_VERSION      = "0.1.2";
constexpr std::string_view PROTOCOL_VERSION    = "2024-11-05";
constexpr std::string_view JSONRPC_VERSION     = "2.0";

} // namespace mcp_echo

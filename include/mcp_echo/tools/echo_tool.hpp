#pragma once
#include "../tool_registry.hpp"

namespace mcp_echo::tools {

/// Descriptor for "echo": an object schema requiring one string "message".
[[nodiscard]] ToolDefinition echo_definition();

/// Returns arguments.message as a single text block. A string comes back
/// byte-for-byte; any other JSON value is rendered as compact JSON text;
/// a missing message yields "". Throws ProtocolError when arguments is not
/// an object.
[[nodiscard]] CallToolResult echo(const nlohmann::json& arguments);

void register_echo(ToolRegistry& registry);

} // namespace mcp_echo::tools

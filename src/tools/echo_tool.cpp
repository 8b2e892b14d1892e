#include "mcp_echo/tools/echo_tool.hpp"
#include "mcp_echo/error.hpp"
#include "mcp_echo/logger.hpp"

namespace mcp_echo::tools {

ToolDefinition echo_definition() {
    ToolDefinition def;
    def.name = "echo";
    def.description = "Returns the input message unchanged. Useful for testing the "
                      "connection or simply echoing text back.";
    def.input_schema = {
        {"type", "object"},
        {"properties", {
            {"message", {{"type", "string"}, {"description", "The message to echo back"}}}
        }},
        {"required", nlohmann::json::array({"message"})}
    };
    return def;
}

CallToolResult echo(const nlohmann::json& arguments) {
    if (!arguments.is_object()) {
        throw ProtocolError(error::InternalError, "echo: 'arguments' must be an object");
    }

    std::string text;
    auto it = arguments.find("message");
    if (it != arguments.end()) {
        text = it->is_string() ? it->get<std::string>() : it->dump();
    }
    MCP_ECHO_LOG_DEBUG("echo", "echoing {} bytes", text.size());

    CallToolResult result;
    result.content.push_back(TextContent{std::move(text)});
    return result;
}

void register_echo(ToolRegistry& registry) {
    registry.add(echo_definition(), &echo);
}

} // namespace mcp_echo::tools

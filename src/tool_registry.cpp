#include "mcp_echo/tool_registry.hpp"
#include "mcp_echo/error.hpp"
#include <stdexcept>

namespace mcp_echo {

void ToolRegistry::add(ToolDefinition def, ToolHandler handler) {
    if (def.name.empty()) {
        throw std::invalid_argument("Tool name must not be empty");
    }
    if (handlers_.count(def.name) > 0) {
        throw std::invalid_argument("Tool already registered: " + def.name);
    }
    if (!handler) {
        throw std::invalid_argument("Tool handler must be callable: " + def.name);
    }
    handlers_.emplace(def.name, std::move(handler));
    tools_.push_back(std::move(def));
}

bool ToolRegistry::contains(const std::string& name) const {
    return handlers_.count(name) > 0;
}

CallToolResult ToolRegistry::call(const std::string& name,
                                  const nlohmann::json& arguments) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        throw ProtocolError(error::InternalError, "Unknown tool: " + name);
    }
    return it->second(arguments);
}

} // namespace mcp_echo

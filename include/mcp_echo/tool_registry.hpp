#pragma once
#include "types.hpp"
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcp_echo {

using ToolHandler = std::function<CallToolResult(const nlohmann::json& arguments)>;

/// Named, schema-described tools in registration order. Filled once at
/// startup and only read afterwards.
class ToolRegistry {
public:
    /// Throws std::invalid_argument on an empty or duplicate name.
    void add(ToolDefinition def, ToolHandler handler);

    [[nodiscard]] const std::vector<ToolDefinition>& list() const noexcept { return tools_; }
    [[nodiscard]] bool contains(const std::string& name) const;
    [[nodiscard]] size_t size() const noexcept { return tools_.size(); }

    /// Invoke a tool by name. Throws ProtocolError for an unknown name;
    /// whatever the handler throws propagates unchanged.
    [[nodiscard]] CallToolResult call(const std::string& name,
                                      const nlohmann::json& arguments) const;

private:
    std::vector<ToolDefinition> tools_;
    std::unordered_map<std::string, ToolHandler> handlers_;
};

} // namespace mcp_echo

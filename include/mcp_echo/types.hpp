#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace mcp_echo {

/// One `{"type":"text","text":...}` block of a tool result.
struct TextContent {
    std::string text;

    bool operator==(const TextContent& o) const { return text == o.text; }
};

/// Capability descriptor as advertised by tools/list. Built once at
/// startup and never mutated afterwards.
struct ToolDefinition {
    std::string name;
    std::optional<std::string> description;
    nlohmann::json input_schema;

    bool operator==(const ToolDefinition& o) const {
        return name == o.name && description == o.description
               && input_schema == o.input_schema;
    }
};

struct CallToolResult {
    std::vector<TextContent> content;
};

/// Name/version pair, used both for our serverInfo and the clientInfo a
/// client sends with initialize.
struct Implementation {
    std::string name;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && version == o.version;
    }
};

struct InitializeResult {
    std::string protocol_version;
    // Each present member is advertised as a capability object.
    std::optional<nlohmann::json> tools_capability;
    Implementation server_info;
};

void to_json(nlohmann::json& j, const TextContent& t);
void to_json(nlohmann::json& j, const ToolDefinition& t);
void to_json(nlohmann::json& j, const CallToolResult& t);

void to_json(nlohmann::json& j, const Implementation& t);
// Missing "version" reads as empty; missing "name" throws.
void from_json(const nlohmann::json& j, Implementation& t);

void to_json(nlohmann::json& j, const InitializeResult& t);

} // namespace mcp_echo

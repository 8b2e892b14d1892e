#include "mcp_echo/types.hpp"

namespace mcp_echo {

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"inputSchema", t.input_schema}};
    if (t.description) j["description"] = *t.description;
}

void to_json(nlohmann::json& j, const CallToolResult& t) {
    nlohmann::json content = nlohmann::json::array();
    for (const auto& block : t.content) {
        content.push_back(block);
    }
    j = {{"content", std::move(content)}};
}

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.at("name").get<std::string>();
    t.version = j.value("version", std::string{});
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    nlohmann::json capabilities = nlohmann::json::object();
    if (t.tools_capability) capabilities["tools"] = *t.tools_capability;

    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", std::move(capabilities)},
        {"serverInfo", t.server_info}
    };
}

} // namespace mcp_echo

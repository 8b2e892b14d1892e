#include <gtest/gtest.h>
#include "mcp_echo/types.hpp"

using namespace mcp_echo;

TEST(Types, ToolDefinitionUsesWireNames) {
    ToolDefinition def;
    def.name = "echo";
    def.input_schema = {{"type", "object"}};

    nlohmann::json j = def;
    EXPECT_EQ(j["name"], "echo");
    EXPECT_EQ(j["inputSchema"]["type"], "object");
    EXPECT_FALSE(j.contains("description"));
    EXPECT_FALSE(j.contains("input_schema"));

    def.description = "Echo it";
    j = def;
    EXPECT_EQ(j["description"], "Echo it");
}

TEST(Types, CallToolResultContentBlocks) {
    CallToolResult result;
    nlohmann::json j = result;
    EXPECT_EQ(j, (nlohmann::json{{"content", nlohmann::json::array()}}));

    result.content.push_back(TextContent{"a"});
    result.content.push_back(TextContent{""});
    j = result;
    ASSERT_EQ(j["content"].size(), 2u);
    EXPECT_EQ(j["content"][0], (nlohmann::json{{"type", "text"}, {"text", "a"}}));
    EXPECT_EQ(j["content"][1]["text"], "");
    EXPECT_FALSE(j.contains("isError"));
}

TEST(Types, InitializeResultShape) {
    InitializeResult init;
    init.protocol_version = "2024-11-05";
    init.server_info = {"echo-server", "0.1.2"};

    nlohmann::json j = init;
    EXPECT_EQ(j["protocolVersion"], "2024-11-05");
    EXPECT_TRUE(j["capabilities"].is_object());
    EXPECT_TRUE(j["capabilities"].empty());
    EXPECT_EQ(j["serverInfo"], (nlohmann::json{{"name", "echo-server"}, {"version", "0.1.2"}}));

    init.tools_capability = nlohmann::json::object();
    j = init;
    EXPECT_EQ(j["capabilities"], (nlohmann::json{{"tools", nlohmann::json::object()}}));
}

TEST(Types, ImplementationFromJson) {
    auto impl = nlohmann::json{{"name", "client"}, {"version", "2.1"}}.get<Implementation>();
    EXPECT_EQ(impl, (Implementation{"client", "2.1"}));

    impl = nlohmann::json{{"name", "bare"}}.get<Implementation>();
    EXPECT_EQ(impl.version, "");

    EXPECT_THROW(nlohmann::json::object().get<Implementation>(), nlohmann::json::exception);
}

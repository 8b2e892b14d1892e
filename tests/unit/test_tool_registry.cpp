#include <gtest/gtest.h>
#include "mcp_echo/tool_registry.hpp"
#include "mcp_echo/error.hpp"

using namespace mcp_echo;

namespace {

ToolDefinition make_def(const std::string& name) {
    ToolDefinition def;
    def.name = name;
    def.input_schema = nlohmann::json{{"type", "object"}};
    return def;
}

CallToolResult constant(const nlohmann::json&) {
    CallToolResult result;
    result.content.push_back(TextContent{"ok"});
    return result;
}

} // namespace

TEST(ToolRegistry, KeepsRegistrationOrder) {
    ToolRegistry registry;
    registry.add(make_def("b"), constant);
    registry.add(make_def("a"), constant);
    ASSERT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.list()[0].name, "b");
    EXPECT_EQ(registry.list()[1].name, "a");
    EXPECT_TRUE(registry.contains("a"));
    EXPECT_FALSE(registry.contains("c"));
}

TEST(ToolRegistry, RejectsDuplicatesAndEmptyNames) {
    ToolRegistry registry;
    registry.add(make_def("a"), constant);
    EXPECT_THROW(registry.add(make_def("a"), constant), std::invalid_argument);
    EXPECT_THROW(registry.add(make_def(""), constant), std::invalid_argument);
    EXPECT_THROW(registry.add(make_def("c"), ToolHandler{}), std::invalid_argument);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(ToolRegistry, CallKnownTool) {
    ToolRegistry registry;
    registry.add(make_def("a"), constant);
    auto result = registry.call("a", nlohmann::json::object());
    ASSERT_EQ(result.content.size(), 1u);
    EXPECT_EQ(result.content[0].text, "ok");
}

TEST(ToolRegistry, CallUnknownToolNamesIt) {
    ToolRegistry registry;
    try {
        (void)registry.call("bogus", nlohmann::json::object());
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.code, error::InternalError);
        EXPECT_NE(std::string(e.what()).find("bogus"), std::string::npos);
    }
}

TEST(ToolRegistry, HandlerExceptionsPropagate) {
    ToolRegistry registry;
    registry.add(make_def("boom"), [](const nlohmann::json&) -> CallToolResult {
        throw std::runtime_error("boom");
    });
    EXPECT_THROW((void)registry.call("boom", nlohmann::json::object()), std::runtime_error);
}

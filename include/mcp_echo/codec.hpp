#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace mcp_echo {

class Codec {
public:
    /// Parse one framed line into a request.
    /// Throws ParseError on invalid JSON, trailing content, a non-object
    /// document, a missing or non-string method, or an id of the wrong type.
    [[nodiscard]] static JsonRpcRequest parse(std::string_view raw);

    /// Serialize to compact single-line JSON. Non-ASCII text stays UTF-8.
    [[nodiscard]] static std::string serialize(const JsonRpcResponse& msg);
    [[nodiscard]] static std::string serialize(const JsonRpcRequest& msg);

private:
    static JsonRpcRequest parse_object(const nlohmann::json& j);
};

} // namespace mcp_echo

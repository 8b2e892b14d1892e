#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace mcp_echo {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params)>;

/// Method-name dispatch table. Owned and driven by a single message loop,
/// so it carries no locking.
class Router {
public:
    /// Register (or replace) the handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Run the handler for the request's method and wrap the outcome in a
    /// response addressed to the request's id. Never throws: unknown
    /// methods and handler exceptions come back as error responses.
    [[nodiscard]] JsonRpcResponse dispatch(const JsonRpcRequest& req) const;

    [[nodiscard]] bool has_handler(const std::string& method) const;
    [[nodiscard]] std::vector<std::string> methods() const;

private:
    std::unordered_map<std::string, RequestHandler> request_handlers_;
};

} // namespace mcp_echo

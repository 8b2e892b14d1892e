#include "mcp_echo/router.hpp"
#include "mcp_echo/error.hpp"
#include "mcp_echo/logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace mcp_echo {

void Router::on_request(const std::string& method, RequestHandler handler) {
    request_handlers_[method] = std::move(handler);
}

bool Router::has_handler(const std::string& method) const {
    return request_handlers_.count(method) > 0;
}

std::vector<std::string> Router::methods() const {
    std::vector<std::string> names;
    names.reserve(request_handlers_.size());
    for (const auto& [name, handler] : request_handlers_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

JsonRpcResponse Router::dispatch(const JsonRpcRequest& req) const {
    auto it = request_handlers_.find(req.method);
    if (it == request_handlers_.end()) {
        MCP_ECHO_LOG_WARN("router", "id={} unknown method '{}'", to_string(req.id), req.method);
        return JsonRpcResponse::failure(
            req.id, JsonRpcError{error::InternalError, "Unknown method: " + req.method});
    }

    nlohmann::json params = req.params ? *req.params : nlohmann::json::object();

    try {
        auto result = it->second(params);
        if (auto* err = std::get_if<JsonRpcError>(&result)) {
            MCP_ECHO_LOG_WARN("router", "id={} method={} failed: {}",
                              to_string(req.id), req.method, err->message);
            return JsonRpcResponse::failure(req.id, std::move(*err));
        }
        return JsonRpcResponse::success(req.id, std::move(std::get<nlohmann::json>(result)));
    } catch (const ProtocolError& e) {
        MCP_ECHO_LOG_WARN("router", "id={} method={} failed: {}",
                          to_string(req.id), req.method, e.what());
        return JsonRpcResponse::failure(req.id, JsonRpcError{e.code, e.what()});
    } catch (const std::exception& e) {
        MCP_ECHO_LOG_WARN("router", "id={} method={} internal error: {}",
                          to_string(req.id), req.method, e.what());
        return JsonRpcResponse::failure(req.id, JsonRpcError{error::InternalError, e.what()});
    }
}

} // namespace mcp_echo

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace mcp_echo {

/// Opaque caller correlator. Every JSON type JSON-RPC allows for an id is
/// kept as its own alternative so the response echoes it with type intact.
using RequestId = std::variant<std::nullptr_t, int64_t, uint64_t, double, std::string>;

inline void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

inline void from_json(const nlohmann::json& j, RequestId& id) {
    if (j.is_null()) {
        id = nullptr;
    } else if (j.is_number_unsigned()) {
        auto v = j.get<uint64_t>();
        if (v <= static_cast<uint64_t>(INT64_MAX)) {
            id = static_cast<int64_t>(v);
        } else {
            id = v;
        }
    } else if (j.is_number_integer()) {
        id = j.get<int64_t>();
    } else if (j.is_number_float()) {
        id = j.get<double>();
    } else if (j.is_string()) {
        id = j.get<std::string>();
    } else {
        throw std::invalid_argument("RequestId must be a string, number or null");
    }
}

/// Human-readable rendering for diagnostics ("<none>" when absent).
std::string to_string(const std::optional<RequestId>& id);

struct JsonRpcError {
    int code;
    std::string message;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message;
    }
};

inline void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
}

inline void from_json(const nlohmann::json& j, JsonRpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
}

struct JsonRpcRequest {
    std::optional<RequestId> id;
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcRequest& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

/// Exactly one of result/error is set; the factories below enforce it.
struct JsonRpcResponse {
    std::optional<RequestId> id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    [[nodiscard]] static JsonRpcResponse success(std::optional<RequestId> id,
                                                 nlohmann::json result);
    [[nodiscard]] static JsonRpcResponse failure(std::optional<RequestId> id,
                                                 JsonRpcError error);

    bool operator==(const JsonRpcResponse& o) const {
        return id == o.id && result == o.result && error == o.error;
    }
};

void to_json(nlohmann::json& j, const JsonRpcRequest& r);
void from_json(const nlohmann::json& j, JsonRpcRequest& r);

void to_json(nlohmann::json& j, const JsonRpcResponse& r);
void from_json(const nlohmann::json& j, JsonRpcResponse& r);

} // namespace mcp_echo

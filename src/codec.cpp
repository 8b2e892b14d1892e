#include "mcp_echo/codec.hpp"
#include "mcp_echo/error.hpp"
#include "mcp_echo/logger.hpp"
#include "mcp_echo/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace mcp_echo {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            // Integers keep their exact type so numeric ids echo unchanged.
            auto number_type = val.get_number_type();
            if (number_type.error() == simdjson::SUCCESS) {
                if (number_type.value() == simdjson::ondemand::number_type::signed_integer) {
                    return nlohmann::json(val.get_int64().value());
                }
                if (number_type.value() == simdjson::ondemand::number_type::unsigned_integer) {
                    return nlohmann::json(val.get_uint64().value());
                }
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            return nlohmann::json(nullptr);
    }
}

nlohmann::json simdjson_doc_to_nlohmann(simdjson::ondemand::document& doc) {
    auto val = doc.get_value();
    if (val.error()) {
        // Scalars at the top level cannot be requests anyway.
        throw ParseError(std::string("Message must be a JSON object: ")
                         + simdjson::error_message(val.error()));
    }
    return simdjson_to_nlohmann(val.value());
}

} // anonymous namespace

JsonRpcRequest Codec::parse_object(const nlohmann::json& j) {
    if (j.contains("jsonrpc")) {
        const auto& version = j.at("jsonrpc");
        if (!version.is_string() || version.get<std::string>() != JSONRPC_VERSION) {
            MCP_ECHO_LOG_WARN("codec", "unexpected jsonrpc version {}, processing anyway",
                              version.dump());
        }
    }

    if (!j.contains("method")) {
        throw ParseError("Missing 'method' field");
    }
    if (!j.at("method").is_string()) {
        throw ParseError("'method' must be a string");
    }

    JsonRpcRequest req;
    try {
        from_json(j, req);
    } catch (const std::exception& e) {
        throw ParseError(std::string("Invalid request: ") + e.what());
    }
    return req;
}

JsonRpcRequest Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    nlohmann::json j;
    try {
        j = simdjson_doc_to_nlohmann(doc);
    } catch (const ParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw ParseError(std::string("JSON conversion error: ") + e.what());
    }

    if (!doc.at_end()) {
        throw ParseError("Trailing content after JSON value");
    }

    if (!j.is_object()) {
        throw ParseError("Message must be a JSON object");
    }

    return parse_object(j);
}

std::string Codec::serialize(const JsonRpcResponse& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump();
}

std::string Codec::serialize(const JsonRpcRequest& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump();
}

} // namespace mcp_echo

#include "mcp_echo/server.hpp"
#include "mcp_echo/error.hpp"
#include "mcp_echo/logger.hpp"
#include "mcp_echo/message_loop.hpp"
#include "mcp_echo/router.hpp"
#include "mcp_echo/tool_registry.hpp"
#include "mcp_echo/tools/echo_tool.hpp"
#include "mcp_echo/transport/framed_reader.hpp"
#include "mcp_echo/transport/framed_writer.hpp"
#include "mcp_echo/transport/stdio_transport.hpp"

#include <stdexcept>
#include <string>

namespace mcp_echo {

// ----------- EchoServer::Impl -----------

struct EchoServer::Impl {
    Options opts;
    Session session;
    Router router;
    ToolRegistry tools;
    bool running{false};

    explicit Impl(Options o) : opts(std::move(o)) {}

    void record_client(const nlohmann::json& params) {
        std::optional<Implementation> client;
        std::optional<std::string> client_proto;
        if (params.is_object()) {
            auto info = params.find("clientInfo");
            if (info != params.end()) {
                try {
                    client = info->get<Implementation>();
                } catch (const nlohmann::json::exception& e) {
                    MCP_ECHO_LOG_DEBUG("server", "ignoring malformed clientInfo: {}", e.what());
                }
            }
            auto proto = params.find("protocolVersion");
            if (proto != params.end() && proto->is_string()) {
                client_proto = proto->get<std::string>();
            }
        }

        session.mark_initialized(client, client_proto);
        MCP_ECHO_LOG_INFO("server", "initialized by {} {} (protocol {})",
                          client ? client->name : std::string("<unknown client>"),
                          client ? client->version : std::string(),
                          client_proto.value_or("<unspecified>"));
    }

    void setup_handlers() {
        // initialize
        router.on_request("initialize", [this](const nlohmann::json& params) -> HandlerResult {
            record_client(params);

            InitializeResult result;
            result.protocol_version = opts.protocol_version;
            result.tools_capability = nlohmann::json::object();
            result.server_info = opts.server_info;

            nlohmann::json j;
            to_json(j, result);
            return j;
        });

        // ping
        router.on_request("ping", [](const nlohmann::json&) -> HandlerResult {
            return nlohmann::json::object();
        });

        // tools/list
        router.on_request("tools/list", [this](const nlohmann::json&) -> HandlerResult {
            nlohmann::json items = nlohmann::json::array();
            for (const auto& def : tools.list()) {
                items.push_back(def);
            }
            return nlohmann::json{{"tools", std::move(items)}};
        });

        // tools/call
        router.on_request("tools/call", [this](const nlohmann::json& params) -> HandlerResult {
            if (!params.is_object()) {
                throw ProtocolError(error::InternalError, "tools/call: 'params' must be an object");
            }
            auto name_it = params.find("name");
            if (name_it == params.end() || !name_it->is_string()) {
                throw ProtocolError(error::InternalError, "tools/call: 'name' must be a string");
            }
            std::string name = name_it->get<std::string>();
            nlohmann::json arguments = params.value("arguments", nlohmann::json::object());

            MCP_ECHO_LOG_DEBUG("server", "calling tool '{}'", name);
            CallToolResult tool_result = tools.call(name, arguments);

            nlohmann::json j;
            to_json(j, tool_result);
            return j;
        });
    }
};

// ----------- EchoServer public API -----------

EchoServer::EchoServer(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {
    tools::register_echo(impl_->tools);
    impl_->setup_handlers();
}

EchoServer::~EchoServer() = default;

uint64_t EchoServer::serve(ITransport& transport) {
    MCP_ECHO_LOG_INFO("server", "{} {} serving (strictly sequential)",
                      impl_->opts.server_info.name, impl_->opts.server_info.version);
    impl_->running = true;

    FramedReader reader(transport);
    FramedWriter writer(transport);
    MessageLoop loop(reader, writer, impl_->router);
    uint64_t answered = loop.run();

    impl_->running = false;
    MCP_ECHO_LOG_INFO("server", "stopped");
    return answered;
}

uint64_t EchoServer::serve(std::unique_ptr<ITransport> transport) {
    if (!transport) {
        throw std::invalid_argument("serve: transport must not be null");
    }
    return serve(*transport);
}

uint64_t EchoServer::serve_stdio() {
    StdioTransport transport(impl_->opts.max_line_bytes);
    return serve(transport);
}

JsonRpcResponse EchoServer::handle(const JsonRpcRequest& request) {
    return impl_->router.dispatch(request);
}

bool EchoServer::is_running() const noexcept {
    return impl_->running;
}

bool EchoServer::is_initialized() const noexcept {
    return impl_->session.initialized();
}

const Session& EchoServer::session() const noexcept {
    return impl_->session;
}

const EchoServer::Options& EchoServer::options() const noexcept {
    return impl_->opts;
}

} // namespace mcp_echo

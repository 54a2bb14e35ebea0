#include "llmtools/server.hpp"
#include "llmtools/codec.hpp"
#include "llmtools/error.hpp"
#include "llmtools/log.hpp"
#include "llmtools/router.hpp"
#include "llmtools/version.hpp"
#include "llmtools/transport/stdio_transport.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>

namespace llmtools {

// ----------- McpServer::Impl -----------

struct McpServer::Impl {
    Options opts;
    Session session;
    Router router;
    ToolRegistry registry;

    // Transport reference so shutdown() can wake a blocked read
    ITransport* transport{nullptr};
    std::mutex transport_mutex;

    std::atomic<bool> running{false};
    std::atomic<bool> stop_requested{false};

    explicit Impl(Options o) : opts(std::move(o)) {}

    template<typename T>
    static T parse_params(const nlohmann::json& params) {
        try {
            return params.get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw McpProtocolError(error::InvalidParams, std::string("Invalid params: ") + e.what());
        } catch (const std::invalid_argument& e) {
            throw McpProtocolError(error::InvalidParams, std::string("Invalid params: ") + e.what());
        }
    }

    static nlohmann::json tool_result(const CallToolResult& result) {
        nlohmann::json j;
        to_json(j, result);
        return j;
    }

    void setup_handlers() {
        // initialize
        router.on_request("initialize", [this](const nlohmann::json& params) -> HandlerResult {
            auto init = parse_params<InitializeParams>(params);
            session.begin(init);
            if (init.client_info) {
                logger()->info("client {} {} connected (protocol {})",
                               init.client_info->name, init.client_info->version,
                               init.protocol_version.empty() ? "unspecified" : init.protocol_version);
            }

            InitializeResult result;
            result.protocol_version = std::string(PROTOCOL_VERSION);
            result.capabilities.tools = nlohmann::json::object();
            result.server_info = opts.server_info;
            result.instructions = opts.instructions;

            nlohmann::json j;
            to_json(j, result);
            return j;
        });

        // initialized: clients send either spelling
        auto on_initialized = [this](const nlohmann::json&) {
            session.set_state(SessionState::Ready);
        };
        router.on_notification("initialized", on_initialized);
        router.on_notification("notifications/initialized", on_initialized);

        // ping
        router.on_request("ping", [](const nlohmann::json&) -> HandlerResult {
            return nlohmann::json::object();
        });

        // tools/list
        router.on_request("tools/list", [this](const nlohmann::json&) -> HandlerResult {
            return nlohmann::json{{"tools", registry.list()}};
        });

        // tools/call
        router.on_request("tools/call", [this](const nlohmann::json& params) -> HandlerResult {
            auto call = parse_params<CallToolParams>(params);

            auto handler = registry.find(call.name);
            if (!handler) {
                logger()->warn("tool not found: {}", call.name);
                return tool_result(CallToolResult::text("Tool not found: " + call.name, true));
            }

            try {
                std::string output = (*handler)(call.arguments);
                return tool_result(CallToolResult::text(std::move(output)));
            } catch (const std::exception& e) {
                logger()->warn("tool {} failed: {}", call.name, e.what());
                return tool_result(CallToolResult::text(std::string("Error: ") + e.what(), true));
            }
        });
    }

    void write_response(ITransport& t, const JsonRpcResponse& resp) {
        try {
            t.write(resp);
        } catch (const nlohmann::json::exception& e) {
            logger()->error("failed to serialize response: {}", e.what());
            t.write(make_internal_error(resp.id, std::string("Failed to serialize response: ") + e.what()));
        }
    }
};

// ----------- McpServer -----------

McpServer::McpServer(Options opts)
    : impl_(std::make_unique<Impl>(std::move(opts))) {
    impl_->setup_handlers();
}

McpServer::~McpServer() = default;

void McpServer::add_tool(ToolDefinition def, ToolHandler handler) {
    logger()->debug("registering tool {}", def.name);
    impl_->registry.add(std::move(def), std::move(handler));
}

bool McpServer::remove_tool(const std::string& name) {
    return impl_->registry.remove(name);
}

const ToolRegistry& McpServer::tools() const {
    return impl_->registry;
}

std::optional<JsonRpcResponse> McpServer::handle(const JsonRpcRequest& req) {
    logger()->debug("dispatch {} id={}", req.method, req.id ? req.id->dump() : "none");
    return impl_->router.dispatch(req);
}

bool McpServer::handle_one(ITransport& transport) {
    std::optional<JsonRpcRequest> req;
    try {
        req = transport.read();
    } catch (const McpProtocolError& e) {
        logger()->warn("rejected message: {}", e.what());
        impl_->write_response(transport, make_error_response(RequestId(), e.code, e.what()));
        return true;
    }
    if (!req) return false;

    auto resp = handle(*req);
    if (resp) impl_->write_response(transport, *resp);
    return true;
}

void McpServer::serve(std::unique_ptr<ITransport> transport) {
    if (!transport) {
        throw std::invalid_argument("Transport cannot be null");
    }
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = transport.get();
    }
    impl_->running = true;
    logger()->info("{} {} serving {} tools", impl_->opts.server_info.name,
                   impl_->opts.server_info.version, impl_->registry.size());

    // Clears the transport reference on every exit path
    struct ServeScope {
        Impl& impl;
        ~ServeScope() {
            impl.running = false;
            std::lock_guard<std::mutex> lock(impl.transport_mutex);
            impl.transport = nullptr;
        }
    } scope{*impl_};

    // Covers a shutdown() that raced ahead of the transport registration
    if (impl_->stop_requested) transport->shutdown();

    while (!impl_->stop_requested && handle_one(*transport)) {
    }

    logger()->info("{} stopped", impl_->opts.server_info.name);
}

void McpServer::serve_stdio() {
    serve(std::make_unique<StdioTransport>());
}

void McpServer::shutdown() {
    impl_->stop_requested = true;
    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    if (impl_->transport) {
        impl_->transport->shutdown();
    }
}

bool McpServer::is_running() const {
    return impl_->running;
}

SessionState McpServer::state() const {
    return impl_->session.state();
}

std::optional<Implementation> McpServer::client_info() const {
    return impl_->session.client_info();
}

} // namespace llmtools

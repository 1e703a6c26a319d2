#include "simplemcp/server.hpp"
#include "simplemcp/codec.hpp"
#include "simplemcp/dispatcher.hpp"
#include "simplemcp/error.hpp"
#include "simplemcp/logger.hpp"
#include "simplemcp/transport/stdio_transport.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace simplemcp {

// ----------- McpServer::Impl -----------

struct McpServer::Impl {
    Options opts;
    Registry registry;
    Session session;
    Dispatcher dispatcher;

    // Transport of the running loop, for shutdown()
    ITransport* transport{nullptr};
    std::mutex transport_mutex;

    std::atomic<bool> started{false};
    std::atomic<bool> running{false};
    std::atomic<bool> shutdown_requested{false};

    Impl(Options o, Registry r)
        : opts(std::move(o)),
          registry(std::move(r)),
          session(opts.server_info),
          dispatcher(registry, session,
                     Dispatcher::Options{opts.instructions, opts.page_size,
                                         opts.redact_handler_errors}) {}

    std::optional<JsonRpcMessage> decode(const nlohmann::json& value, FrameWriter& writer) {
        try {
            return Codec::decode(value);
        } catch (const InvalidRequestError& e) {
            // Only answer when the client can correlate the error
            auto id = Codec::recover_id(value);
            if (id) {
                SIMPLEMCP_LOG_WARN("invalid request {}: {}", to_string(*id), e.what());
                writer.write(make_error_response(*id, e.code, e.what()));
            } else {
                SIMPLEMCP_LOG_WARN("dropping invalid message: {}", e.what());
            }
            return std::nullopt;
        }
    }

    void handle(const nlohmann::json& value, FrameWriter& writer) {
        auto msg = decode(value, writer);
        if (!msg) return;

        auto response = dispatcher.dispatch(*msg);
        if (response) {
            writer.write(*response);
        }
    }

    void loop(ITransport& t) {
        Framer framer(opts.framing, opts.max_message_size);
        FrameWriter writer(t, framer);

        while (true) {
            auto chunk = t.read_chunk();
            if (!chunk) {
                if (auto last = framer.finish()) {
                    handle(*last, writer);
                }
                SIMPLEMCP_LOG_INFO("client disconnected");
                return;
            }
            framer.feed(*chunk);
            while (auto value = framer.next()) {
                handle(*value, writer);
            }
        }
    }
};

// ----------- McpServer -----------

McpServer::McpServer(Options opts, Registry registry)
    : impl_(std::make_unique<Impl>(std::move(opts), std::move(registry))) {}

McpServer::~McpServer() {
    if (impl_) {
        shutdown();
    }
}

void McpServer::serve(ITransport& transport) {
    if (impl_->started.exchange(true)) {
        throw McpError("serve() may only be called once per server");
    }
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = &transport;
        impl_->running = true;
    }
    // shutdown() raced ahead of us; close now so read_chunk() returns at once
    if (impl_->shutdown_requested) transport.close();

    SIMPLEMCP_LOG_INFO("serving {} {}", impl_->opts.server_info.name, impl_->opts.server_info.version);
    try {
        impl_->loop(transport);
    } catch (const UnexpectedEofError& e) {
        SIMPLEMCP_LOG_WARN("connection truncated: {}", e.what());
    } catch (const FramingError& e) {
        SIMPLEMCP_LOG_ERROR("framing error, closing connection: {}", e.what());
    } catch (const McpTransportError& e) {
        if (impl_->shutdown_requested) {
            SIMPLEMCP_LOG_DEBUG("transport closed during shutdown: {}", e.what());
        } else {
            SIMPLEMCP_LOG_ERROR("transport error, closing connection: {}", e.what());
        }
    }

    impl_->session.close();
    transport.close();
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = nullptr;
        impl_->running = false;
    }
    SIMPLEMCP_LOG_INFO("server stopped");
}

void McpServer::serve(std::unique_ptr<ITransport> transport) {
    if (!transport) {
        throw McpError("serve() requires a transport");
    }
    serve(*transport);
}

void McpServer::serve_stdio() {
    StdioTransport transport;
    serve(transport);
}

void McpServer::shutdown() {
    impl_->shutdown_requested = true;
    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    if (impl_->transport) {
        impl_->transport->close();
    }
}

bool McpServer::is_running() const {
    return impl_->running;
}

SessionState McpServer::state() const {
    return impl_->session.state();
}

const Registry& McpServer::registry() const {
    return impl_->registry;
}

const McpServer::Options& McpServer::options() const {
    return impl_->opts;
}

// ----------- ServerBuilder -----------

ServerBuilder::ServerBuilder(std::string name) {
    opts_.server_info.name = std::move(name);
}

ServerBuilder& ServerBuilder::with_server_info(std::string name, std::string version) {
    opts_.server_info = Implementation{std::move(name), std::move(version)};
    return *this;
}

ServerBuilder& ServerBuilder::with_instructions(std::string instructions) {
    opts_.instructions = std::move(instructions);
    return *this;
}

ServerBuilder& ServerBuilder::with_options(McpServer::Options opts) {
    opts_ = std::move(opts);
    return *this;
}

ServerBuilder& ServerBuilder::tool(std::string name, std::string description, ToolHandler handler) {
    ToolDefinition def;
    def.name = std::move(name);
    def.description = std::move(description);
    return tool(std::move(def), std::move(handler));
}

ServerBuilder& ServerBuilder::tool(ToolDefinition def, ToolHandler handler) {
    registry_.add_tool(std::move(def), std::move(handler));
    return *this;
}

ServerBuilder& ServerBuilder::prompt(std::string name, std::string description, PromptHandler handler) {
    PromptDefinition def;
    def.name = std::move(name);
    def.description = std::move(description);
    return prompt(std::move(def), std::move(handler));
}

ServerBuilder& ServerBuilder::prompt(PromptDefinition def, PromptHandler handler) {
    registry_.add_prompt(std::move(def), std::move(handler));
    return *this;
}

ServerBuilder& ServerBuilder::resource(std::string uri, std::string name, std::string description,
                                       std::string mime_type, ResourceHandler handler) {
    ResourceDefinition def;
    def.uri = std::move(uri);
    def.name = std::move(name);
    def.description = std::move(description);
    def.mime_type = std::move(mime_type);
    return resource(std::move(def), std::move(handler));
}

ServerBuilder& ServerBuilder::resource(ResourceDefinition def, ResourceHandler handler) {
    registry_.add_resource(std::move(def), std::move(handler));
    return *this;
}

std::unique_ptr<McpServer> ServerBuilder::build() {
    return std::make_unique<McpServer>(opts_, registry_.build());
}

void ServerBuilder::run() {
    build()->serve_stdio();
}

} // namespace simplemcp

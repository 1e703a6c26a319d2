#pragma once
#include "framer.hpp"
#include "registry.hpp"
#include "session.hpp"
#include "types.hpp"
#include "version.hpp"
#include "transport/transport.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace simplemcp {

/// MCP server over a single byte-stream connection.
///
/// One instance serves one connection, once: serve() blocks for the lifetime
/// of the connection and a second call throws McpError. Capabilities are fixed
/// at construction (see ServerBuilder). Independent instances may coexist.
class McpServer {
public:
    struct Options {
        Implementation server_info{"mcp-server", std::string(LIBRARY_VERSION)};
        std::optional<std::string> instructions;
        /// Entries per list page; 0 disables pagination.
        std::size_t page_size = 50;
        FramingMode framing = FramingMode::NewlineDelimited;
        std::size_t max_message_size = DEFAULT_MAX_MESSAGE_SIZE;
        /// Hide messages of unexpected handler exceptions from clients.
        bool redact_handler_errors = false;
    };

    McpServer(Options opts, Registry registry);
    ~McpServer();

    // Non-copyable, non-movable
    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    /// Run the read-dispatch-write loop until end of stream, a framing error,
    /// a transport error or shutdown(). The transport is closed on return.
    /// Connection-level failures are logged, not thrown.
    void serve(ITransport& transport);

    /// Same, taking ownership; the transport is destroyed on return.
    void serve(std::unique_ptr<ITransport> transport);

    /// Serve over the process stdin/stdout.
    void serve_stdio();

    /// Close the transport of a running serve() from another thread.
    void shutdown();

    [[nodiscard]] bool is_running() const;
    [[nodiscard]] SessionState state() const;
    [[nodiscard]] const Registry& registry() const;
    [[nodiscard]] const Options& options() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Fluent registration front end. Collects tools, prompts and resources,
/// then produces a server whose registry can no longer change.
///
///     simplemcp::ServerBuilder("weather")
///         .tool("forecast", "Forecast for a city", forecast)
///         .resource("weather://stations", "stations")
///         .run();
class ServerBuilder {
public:
    explicit ServerBuilder(std::string name = "mcp-server");

    ServerBuilder& with_server_info(std::string name, std::string version);
    ServerBuilder& with_instructions(std::string instructions);
    ServerBuilder& with_options(McpServer::Options opts);
    McpServer::Options& options() { return opts_; }

    ServerBuilder& tool(std::string name, std::string description, ToolHandler handler);
    ServerBuilder& tool(ToolDefinition def, ToolHandler handler);

    ServerBuilder& prompt(std::string name, std::string description, PromptHandler handler);
    ServerBuilder& prompt(PromptDefinition def, PromptHandler handler);

    ServerBuilder& resource(std::string uri, std::string name, std::string description = "",
                            std::string mime_type = "text/plain", ResourceHandler handler = nullptr);
    ServerBuilder& resource(ResourceDefinition def, ResourceHandler handler = nullptr);

    /// Finish registration. Further registrations throw RegistryFrozenError.
    [[nodiscard]] std::unique_ptr<McpServer> build();

    /// build() and serve stdin/stdout until the client disconnects.
    void run();

private:
    McpServer::Options opts_;
    RegistryBuilder registry_;
};

} // namespace simplemcp

#pragma once
#include "json_rpc.hpp"
#include "registry.hpp"
#include "router.hpp"
#include "session.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace simplemcp {

/// Routes decoded messages to the built-in MCP methods.
///
/// Built-ins: initialize, ping, tools/list, tools/call, prompts/list,
/// prompts/get, resources/list, resources/read, plus the
/// notifications/initialized and notifications/cancelled notifications.
///
/// Before the session is initialized only initialize is served;
/// other requests get NotInitialized and notifications are dropped.
/// Notifications never produce a response, even when their handler fails.
class Dispatcher {
public:
    struct Options {
        std::optional<std::string> instructions;
        /// Entries per list page; 0 disables pagination.
        std::size_t page_size = 50;
        /// Hide messages of unexpected handler exceptions from clients.
        bool redact_handler_errors = false;
    };

    Dispatcher(const Registry& registry, Session& session, Options opts);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Handle one message. Returns the response to send, if any.
    [[nodiscard]] std::optional<JsonRpcResponse> dispatch(const JsonRpcMessage& msg);

    /// Capability kinds advertised during initialize.
    [[nodiscard]] ServerCapabilities capabilities() const;

private:
    void setup_handlers();

    HandlerResult handle_initialize(const nlohmann::json& params);
    HandlerResult handle_call_tool(const nlohmann::json& params);
    HandlerResult handle_get_prompt(const nlohmann::json& params);
    HandlerResult handle_read_resource(const nlohmann::json& params);

    const Registry& registry_;
    Session& session_;
    Options opts_;
    Router router_;
};

} // namespace simplemcp

#pragma once
#include "json_rpc.hpp"
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace simplemcp {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;

/// Convert an exception thrown by a handler into a JSON-RPC error.
/// McpProtocolError keeps its code; malformed params map to InvalidParams;
/// anything else is a HandlerFailure. With redact set, the message of an
/// unexpected exception is replaced by a generic one.
JsonRpcError error_from_exception(const std::exception& e, bool redact = false);

/// Method table mapping JSON-RPC method names to handlers.
/// Handlers are registered before serving starts; dispatch() does not lock.
class Router {
public:
    /// Register a request handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Register a notification handler.
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Dispatch a request. Always yields a response carrying the request id.
    [[nodiscard]] JsonRpcResponse dispatch(const JsonRpcRequest& req) const;

    /// Dispatch a notification. Nothing is returned, handler errors are logged.
    /// A notification for a method that only has a request handler runs that
    /// handler and discards its result.
    void dispatch(const JsonRpcNotification& notif) const;

    [[nodiscard]] bool has_handler(const std::string& method) const;

    void set_redact_errors(bool redact) { redact_errors_ = redact; }

private:
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
    bool redact_errors_{false};
};

} // namespace simplemcp

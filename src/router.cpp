#include "simplemcp/router.hpp"
#include "simplemcp/error.hpp"
#include "simplemcp/logger.hpp"
#include <stdexcept>

namespace simplemcp {

JsonRpcError error_from_exception(const std::exception& e, bool redact) {
    if (const auto* proto = dynamic_cast<const McpProtocolError*>(&e)) {
        return JsonRpcError{proto->code, proto->what(), std::nullopt};
    }
    // at() on a missing key, get<T>() on the wrong type, and the like
    if (dynamic_cast<const nlohmann::json::exception*>(&e) ||
        dynamic_cast<const std::invalid_argument*>(&e)) {
        return JsonRpcError{error::InvalidParams, std::string("Invalid params: ") + e.what(),
                            std::nullopt};
    }
    if (redact) {
        return JsonRpcError{error::HandlerFailure, "Handler failed", std::nullopt};
    }
    return JsonRpcError{error::HandlerFailure, e.what(), std::nullopt};
}

void Router::on_request(const std::string& method, RequestHandler handler) {
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    notification_handlers_[method] = std::move(handler);
}

bool Router::has_handler(const std::string& method) const {
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

JsonRpcResponse Router::dispatch(const JsonRpcRequest& req) const {
    const nlohmann::json params = req.params ? *req.params : nlohmann::json::object();

    auto it = request_handlers_.find(req.method);
    if (it == request_handlers_.end()) {
        return make_error_response(req.id, error::MethodNotFound, "Method not found: " + req.method);
    }

    try {
        auto result = it->second(params);

        JsonRpcResponse resp;
        resp.id = req.id;
        if (auto* ok = std::get_if<nlohmann::json>(&result)) {
            resp.result = std::move(*ok);
        } else if (auto* err = std::get_if<JsonRpcError>(&result)) {
            resp.error = std::move(*err);
        }
        return resp;
    } catch (const std::exception& e) {
        auto err = error_from_exception(e, redact_errors_);
        if (err.code == error::HandlerFailure) {
            SIMPLEMCP_LOG_WARN("{} (id {}) failed: {}", req.method, to_string(req.id), e.what());
        }
        JsonRpcResponse resp;
        resp.id = req.id;
        resp.error = std::move(err);
        return resp;
    } catch (...) {
        SIMPLEMCP_LOG_WARN("{} (id {}) failed with a non-standard exception", req.method,
                           to_string(req.id));
        return make_error_response(req.id, error::HandlerFailure, "Handler failed");
    }
}

void Router::dispatch(const JsonRpcNotification& notif) const {
    const nlohmann::json params = notif.params ? *notif.params : nlohmann::json::object();

    try {
        auto nit = notification_handlers_.find(notif.method);
        if (nit != notification_handlers_.end()) {
            nit->second(params);
            return;
        }
        auto rit = request_handlers_.find(notif.method);
        if (rit == request_handlers_.end()) {
            SIMPLEMCP_LOG_DEBUG("ignoring unknown notification '{}'", notif.method);
            return;
        }
        auto result = rit->second(params);
        if (auto* err = std::get_if<JsonRpcError>(&result)) {
            SIMPLEMCP_LOG_DEBUG("notification '{}' failed ({}): {}", notif.method, err->code, err->message);
        }
    } catch (const std::exception& e) {
        // No response channel for notifications
        SIMPLEMCP_LOG_DEBUG("notification '{}' failed: {}", notif.method, e.what());
    } catch (...) {
        SIMPLEMCP_LOG_DEBUG("notification '{}' failed", notif.method);
    }
}

} // namespace simplemcp

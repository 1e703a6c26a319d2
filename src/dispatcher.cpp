#include "simplemcp/dispatcher.hpp"
#include "simplemcp/error.hpp"
#include "simplemcp/logger.hpp"
#include "simplemcp/schema.hpp"
#include "simplemcp/version.hpp"
#include <algorithm>
#include <limits>

namespace simplemcp {

namespace {

// Cursors are the decimal offset of the first entry of the next page.
std::size_t parse_cursor(const nlohmann::json& params) {
    auto it = params.find("cursor");
    if (it == params.end() || it->is_null()) return 0;
    if (!it->is_string()) throw InvalidParamsError("Invalid cursor");
    const std::string& s = it->get_ref<const std::string&>();
    if (s.empty() || s.size() > 18 ||
        !std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        throw InvalidParamsError("Invalid cursor: " + s);
    }
    return static_cast<std::size_t>(std::stoull(s));
}

template<typename Entry>
nlohmann::json list_page(const std::vector<Entry>& items, const char* field,
                         const nlohmann::json& params, std::size_t page_size) {
    std::size_t start = parse_cursor(params);
    if (start > items.size()) throw InvalidParamsError("Cursor out of range");

    std::size_t limit = page_size == 0 ? std::numeric_limits<std::size_t>::max() : page_size;
    std::size_t end = items.size() - start > limit ? start + limit : items.size();

    nlohmann::json page = nlohmann::json::array();
    for (std::size_t i = start; i < end; ++i) {
        page.push_back(items[i].definition);
    }
    nlohmann::json result = {{field, std::move(page)}};
    if (end < items.size()) result["nextCursor"] = std::to_string(end);
    return result;
}

const std::string& require_string(const nlohmann::json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || !it->is_string()) {
        throw InvalidParamsError(std::string("Missing or invalid '") + key + "'");
    }
    return it->get_ref<const std::string&>();
}

nlohmann::json arguments_of(const nlohmann::json& params) {
    auto it = params.find("arguments");
    if (it == params.end() || it->is_null()) return nlohmann::json::object();
    if (!it->is_object()) throw InvalidParamsError("'arguments' must be an object");
    return *it;
}

bool supported_protocol(const std::string& version) {
    return std::find(SUPPORTED_PROTOCOL_VERSIONS.begin(), SUPPORTED_PROTOCOL_VERSIONS.end(),
                     version) != SUPPORTED_PROTOCOL_VERSIONS.end();
}

} // anonymous namespace

Dispatcher::Dispatcher(const Registry& registry, Session& session, Options opts)
    : registry_(registry), session_(session), opts_(std::move(opts)) {
    router_.set_redact_errors(opts_.redact_handler_errors);
    setup_handlers();
}

ServerCapabilities Dispatcher::capabilities() const {
    ServerCapabilities caps;
    caps.tools = !registry_.empty(CapabilityKind::Tool);
    caps.prompts = !registry_.empty(CapabilityKind::Prompt);
    caps.resources = !registry_.empty(CapabilityKind::Resource);
    return caps;
}

void Dispatcher::setup_handlers() {
    router_.on_request("initialize", [this](const nlohmann::json& params) {
        return handle_initialize(params);
    });

    router_.on_request("ping", [](const nlohmann::json&) -> HandlerResult {
        return nlohmann::json::object();
    });

    router_.on_request("tools/list", [this](const nlohmann::json& params) -> HandlerResult {
        return list_page(registry_.tools(), "tools", params, opts_.page_size);
    });

    router_.on_request("tools/call", [this](const nlohmann::json& params) {
        return handle_call_tool(params);
    });

    router_.on_request("prompts/list", [this](const nlohmann::json& params) -> HandlerResult {
        return list_page(registry_.prompts(), "prompts", params, opts_.page_size);
    });

    router_.on_request("prompts/get", [this](const nlohmann::json& params) {
        return handle_get_prompt(params);
    });

    router_.on_request("resources/list", [this](const nlohmann::json& params) -> HandlerResult {
        return list_page(registry_.resources(), "resources", params, opts_.page_size);
    });

    router_.on_request("resources/read", [this](const nlohmann::json& params) {
        return handle_read_resource(params);
    });

    router_.on_notification("notifications/initialized", [](const nlohmann::json&) {
        SIMPLEMCP_LOG_DEBUG("client confirmed initialization");
    });

    // Requests are answered before the next message is read, so there is
    // never anything in flight to cancel.
    router_.on_notification("notifications/cancelled", [](const nlohmann::json& params) {
        SIMPLEMCP_LOG_DEBUG("dropping cancellation for request {}",
                            params.value("requestId", nlohmann::json()).dump());
    });
}

HandlerResult Dispatcher::handle_initialize(const nlohmann::json& params) {
    std::string negotiated(PROTOCOL_VERSION);
    if (auto it = params.find("protocolVersion"); it != params.end() && !it->is_null()) {
        if (!it->is_string()) {
            throw InvalidParamsError("'protocolVersion' must be a string");
        }
        const std::string& requested = it->get_ref<const std::string&>();
        if (!supported_protocol(requested)) {
            nlohmann::json supported = nlohmann::json::array();
            for (auto v : SUPPORTED_PROTOCOL_VERSIONS) supported.push_back(std::string(v));
            return JsonRpcError{error::InvalidParams, "Unsupported protocol version: " + requested,
                                nlohmann::json{{"supported", supported}, {"requested", requested}}};
        }
        negotiated = requested;
    }

    std::optional<Implementation> client_info;
    if (auto it = params.find("clientInfo"); it != params.end() && it->is_object()) {
        client_info = it->get<Implementation>();
    }
    nlohmann::json client_caps = params.value("capabilities", nlohmann::json::object());

    session_.mark_initialized(client_info, negotiated, std::move(client_caps));
    SIMPLEMCP_LOG_INFO("session initialized by {} (protocol {})",
                       client_info ? client_info->name : std::string("unnamed client"), negotiated);

    InitializeResult result;
    result.protocol_version = negotiated;
    result.capabilities = capabilities();
    result.server_info = session_.server_info();
    result.instructions = opts_.instructions;

    nlohmann::json j;
    to_json(j, result);
    return j;
}

HandlerResult Dispatcher::handle_call_tool(const nlohmann::json& params) {
    const std::string& name = require_string(params, "name");
    const ToolEntry& entry = registry_.tool(name);
    nlohmann::json arguments = arguments_of(params);

    if (entry.definition.input_schema) {
        schema::validate(*entry.definition.input_schema, arguments);
    }

    SIMPLEMCP_LOG_DEBUG("calling tool '{}'", name);
    return nlohmann::json{{"content", entry.handler(arguments)}};
}

HandlerResult Dispatcher::handle_get_prompt(const nlohmann::json& params) {
    const std::string& name = require_string(params, "name");
    const PromptEntry& entry = registry_.prompt(name);
    nlohmann::json arguments = arguments_of(params);

    for (const auto& arg : entry.definition.arguments) {
        if (arg.required && !arguments.contains(arg.name)) {
            throw InvalidParamsError("Missing required argument: " + arg.name);
        }
    }

    return nlohmann::json{{"description", entry.definition.description},
                          {"messages", entry.handler(arguments)}};
}

HandlerResult Dispatcher::handle_read_resource(const nlohmann::json& params) {
    const std::string& uri = require_string(params, "uri");
    const ResourceEntry& entry = registry_.resource(uri);

    if (!entry.handler) {
        return nlohmann::json{{"contents", text_resource(uri, entry.definition.mime_type, "")}};
    }
    return nlohmann::json{{"contents", entry.handler(uri)}};
}

std::optional<JsonRpcResponse> Dispatcher::dispatch(const JsonRpcMessage& msg) {
    if (const auto* req = std::get_if<JsonRpcRequest>(&msg)) {
        if (!session_.is_initialized() && req->method != "initialize") {
            SIMPLEMCP_LOG_DEBUG("rejecting '{}' before initialization", req->method);
            return make_error_response(req->id, error::NotInitialized,
                                       "Server not initialized: " + req->method);
        }
        return router_.dispatch(*req);
    }

    if (const auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        if (!session_.is_initialized()) {
            SIMPLEMCP_LOG_DEBUG("dropping notification '{}' before initialization", notif->method);
            return std::nullopt;
        }
        router_.dispatch(*notif);
        return std::nullopt;
    }

    // This server sends no requests, so any response is unsolicited
    const auto& resp = std::get<JsonRpcResponse>(msg);
    SIMPLEMCP_LOG_DEBUG("ignoring unsolicited response with id {}", to_string(resp.id));
    return std::nullopt;
}

} // namespace simplemcp

#include "simplemcp/json_rpc.hpp"
#include "simplemcp/error.hpp"
#include "simplemcp/version.hpp"
#include <limits>

namespace simplemcp {

namespace {

nlohmann::json envelope() {
    return nlohmann::json{{"jsonrpc", std::string(JSONRPC_VERSION)}};
}

std::optional<nlohmann::json> optional_member(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return std::nullopt;
    return *it;
}

} // anonymous namespace

std::string to_string(const RequestId& id) {
    nlohmann::json j;
    to_json(j, id);
    return j.dump();
}

JsonRpcResponse make_error_response(const RequestId& id, int code, std::string message,
                                    std::optional<nlohmann::json> data) {
    JsonRpcResponse resp;
    resp.id = id;
    resp.error = JsonRpcError{code, std::move(message), std::move(data)};
    return resp;
}

// ---------- RequestId ----------

void to_json(nlohmann::json& j, const RequestId& id) {
    std::visit([&j](const auto& v) { j = v; }, id);
}

void from_json(const nlohmann::json& j, RequestId& id) {
    switch (j.type()) {
        case nlohmann::json::value_t::number_unsigned:
            if (j.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                throw InvalidRequestError("Request id out of range");
            }
            id = j.get<int64_t>();
            return;
        case nlohmann::json::value_t::number_integer:
            id = j.get<int64_t>();
            return;
        case nlohmann::json::value_t::number_float:
            id = j.get<double>();
            return;
        case nlohmann::json::value_t::string:
            id = j.get<std::string>();
            return;
        default:
            throw InvalidRequestError("Request id must be a number or a string");
    }
}

// ---------- JsonRpcError ----------

void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = {{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

void from_json(const nlohmann::json& j, JsonRpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
    e.data = optional_member(j, "data");
}

// ---------- Messages ----------

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    j = envelope();
    to_json(j["id"], r.id);
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void from_json(const nlohmann::json& j, JsonRpcRequest& r) {
    from_json(j.at("id"), r.id);
    j.at("method").get_to(r.method);
    r.params = optional_member(j, "params");
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    j = envelope();
    to_json(j["id"], r.id);
    if (r.error) {
        j["error"] = *r.error;
    } else {
        j["result"] = r.result.value_or(nlohmann::json::object());
    }
}

void from_json(const nlohmann::json& j, JsonRpcResponse& r) {
    from_json(j.at("id"), r.id);
    r.result = optional_member(j, "result");
    if (auto err = optional_member(j, "error")) r.error = err->get<JsonRpcError>();
}

void to_json(nlohmann::json& j, const JsonRpcNotification& n) {
    j = envelope();
    j["method"] = n.method;
    if (n.params) j["params"] = *n.params;
}

void from_json(const nlohmann::json& j, JsonRpcNotification& n) {
    j.at("method").get_to(n.method);
    n.params = optional_member(j, "params");
}

void to_json(nlohmann::json& j, const JsonRpcMessage& m) {
    std::visit([&j](const auto& v) { to_json(j, v); }, m);
}

} // namespace simplemcp

#include "simplemcp/codec.hpp"
#include "simplemcp/error.hpp"
#include "simplemcp/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace simplemcp {

namespace {

// Integers wider than 64 bits: nlohmann reads the token as a double
nlohmann::json number_from_token(simdjson::ondemand::value& val) {
    std::string_view raw = val.raw_json_token();
    nlohmann::json j = nlohmann::json::parse(raw.begin(), raw.end(), nullptr, false);
    if (!j.is_number()) {
        throw FramingError("Invalid number: " + std::string(raw));
    }
    return j;
}

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
            // Keep integers as integers so request ids are echoed unchanged
            simdjson::ondemand::number_type nt;
            if (val.get_number_type().get(nt) == simdjson::SUCCESS) {
                if (nt == simdjson::ondemand::number_type::signed_integer) {
                    return nlohmann::json(val.get_int64().value());
                }
                if (nt == simdjson::ondemand::number_type::unsigned_integer) {
                    return nlohmann::json(val.get_uint64().value());
                }
                double d;
                if (nt == simdjson::ondemand::number_type::floating_point_number &&
                    val.get_double().get(d) == simdjson::SUCCESS) {
                    return nlohmann::json(d);
                }
            }
            return number_from_token(val);
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            throw FramingError("Unsupported JSON value");
    }
}

bool is_structured(const nlohmann::json& j) {
    return j.is_object() || j.is_array();
}

} // anonymous namespace

nlohmann::json Codec::parse_json(std::string_view raw) {
    if (raw.empty()) {
        throw FramingError("Empty message");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw FramingError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    nlohmann::json j;
    try {
        simdjson::ondemand::value root;
        error = doc.get_value().get(root);
        if (error) {
            throw FramingError(std::string("JSON parse error: ") + simdjson::error_message(error));
        }
        j = simdjson_to_nlohmann(root);
        if (!doc.at_end()) {
            throw FramingError("Trailing content after JSON value");
        }
    } catch (const simdjson::simdjson_error& e) {
        throw FramingError(std::string("JSON parse error: ") + e.what());
    }
    return j;
}

JsonRpcMessage Codec::decode(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw InvalidRequestError("Message must be a JSON object");
    }
    // An absent "jsonrpc" member is read as 2.0; only a different version is refused
    auto version = j.find("jsonrpc");
    if (version != j.end() &&
        (!version->is_string() || version->get<std::string>() != JSONRPC_VERSION)) {
        throw InvalidRequestError("Invalid jsonrpc version, expected '2.0'");
    }

    bool has_method = j.contains("method");
    bool has_id = j.contains("id") && !j.at("id").is_null();

    if (has_method) {
        if (!j.at("method").is_string()) {
            throw InvalidRequestError("'method' must be a string");
        }
        std::optional<nlohmann::json> params;
        if (j.contains("params")) {
            if (!is_structured(j.at("params"))) {
                throw InvalidRequestError("'params' must be an object or an array");
            }
            params = j.at("params");
        }

        if (!has_id) {
            // Absent and null ids both mark a notification
            JsonRpcNotification notif;
            notif.method = j.at("method").get<std::string>();
            notif.params = std::move(params);
            return notif;
        }
        JsonRpcRequest req;
        from_json(j.at("id"), req.id);
        req.method = j.at("method").get<std::string>();
        req.params = std::move(params);
        return req;
    }

    if (has_id) {
        bool has_result = j.contains("result");
        bool has_error = j.contains("error");
        if (has_result == has_error) {
            throw InvalidRequestError("Response must carry exactly one of 'result' or 'error'");
        }
        JsonRpcResponse resp;
        from_json(j.at("id"), resp.id);
        if (has_result) {
            resp.result = j.at("result");
        } else {
            try {
                resp.error = j.at("error").get<JsonRpcError>();
            } catch (const nlohmann::json::exception& e) {
                throw InvalidRequestError(std::string("Malformed error object: ") + e.what());
            }
        }
        return resp;
    }

    throw InvalidRequestError("Cannot determine message type: missing both 'id' and 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    return decode(parse_json(raw));
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    // Replace invalid UTF-8 from handlers rather than failing the write
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<RequestId> Codec::recover_id(const nlohmann::json& j) noexcept {
    if (!j.is_object()) return std::nullopt;
    auto it = j.find("id");
    if (it == j.end() || it->is_null()) return std::nullopt;
    try {
        RequestId id;
        from_json(*it, id);
        return id;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace simplemcp

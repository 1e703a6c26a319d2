#include "simplemcp/schema.hpp"
#include "simplemcp/error.hpp"
#include <string>

namespace simplemcp {
namespace schema {

namespace {

bool is_type(const nlohmann::json& inst, const std::string& type) {
    if (type == "object") return inst.is_object();
    if (type == "array") return inst.is_array();
    if (type == "string") return inst.is_string();
    if (type == "number") return inst.is_number();
    if (type == "integer") return inst.is_number_integer();
    if (type == "boolean") return inst.is_boolean();
    if (type == "null") return inst.is_null();
    return true; // unknown treated as pass-through
}

std::string where(const std::string& path) {
    return path.empty() ? "arguments" : path;
}

void validate_at(const nlohmann::json& schema, const nlohmann::json& inst, const std::string& path) {
    if (!schema.is_object()) return;

    if (auto t = schema.find("type"); t != schema.end()) {
        bool ok = false;
        if (t->is_string()) {
            ok = is_type(inst, t->get<std::string>());
        } else if (t->is_array()) {
            for (const auto& alt : *t) {
                if (alt.is_string() && is_type(inst, alt.get<std::string>())) {
                    ok = true;
                    break;
                }
            }
        } else {
            ok = true;
        }
        if (!ok) {
            throw InvalidParamsError("type mismatch for " + where(path) + ": expected " + t->dump());
        }
    }

    if (auto e = schema.find("enum"); e != schema.end() && e->is_array()) {
        bool found = false;
        for (const auto& allowed : *e) {
            if (allowed == inst) {
                found = true;
                break;
            }
        }
        if (!found) throw InvalidParamsError("value not allowed for " + where(path));
    }

    if (inst.is_object()) {
        if (auto req = schema.find("required"); req != schema.end() && req->is_array()) {
            for (const auto& key : *req) {
                if (key.is_string() && !inst.contains(key.get<std::string>())) {
                    throw InvalidParamsError("missing required: " +
                                             (path.empty() ? "" : path + ".") + key.get<std::string>());
                }
            }
        }
        auto props = schema.find("properties");
        bool has_props = props != schema.end() && props->is_object();
        if (has_props) {
            for (const auto& [name, subschema] : props->items()) {
                auto it = inst.find(name);
                if (it != inst.end()) {
                    validate_at(subschema, *it, path.empty() ? name : path + "." + name);
                }
            }
        }
        auto extra = schema.find("additionalProperties");
        if (extra != schema.end() && extra->is_boolean() && !extra->get<bool>()) {
            for (const auto& [name, value] : inst.items()) {
                (void)value;
                if (!has_props || !props->contains(name)) {
                    throw InvalidParamsError("unexpected property: " +
                                             (path.empty() ? "" : path + ".") + name);
                }
            }
        }
    }

    if (inst.is_array()) {
        if (auto items = schema.find("items"); items != schema.end() && items->is_object()) {
            for (std::size_t i = 0; i < inst.size(); ++i) {
                validate_at(*items, inst[i], where(path) + "[" + std::to_string(i) + "]");
            }
        }
    }
}

} // anonymous namespace

void validate(const nlohmann::json& schema, const nlohmann::json& instance) {
    validate_at(schema, instance, "");
}

} // namespace schema
} // namespace simplemcp

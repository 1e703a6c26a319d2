#pragma once
#include <nlohmann/json.hpp>

namespace simplemcp {
namespace schema {

/// Check a value against the subset of JSON Schema used for tool inputs:
/// type (name or list of names), required, properties (recursively),
/// additionalProperties: false, items, and enum.
/// Throws InvalidParamsError naming the offending path.
void validate(const nlohmann::json& schema, const nlohmann::json& instance);

} // namespace schema
} // namespace simplemcp

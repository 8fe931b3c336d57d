#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace toolguard::input {

struct IntField {
    const char* name;
    long long min;
    long long max;
    long long default_value;
};

// Each helper throws ToolError(INVALID_INPUT) naming the offending field.
void RequireObject(const nlohmann::json& raw);
void RejectUnknownFields(const nlohmann::json& raw, const std::vector<std::string>& known);

// Null when the field is absent. A present JSON null counts as a value.
const nlohmann::json* FindField(const nlohmann::json& raw, const char* name);

// Integer within [min, max], or the default when absent. Floating values
// with no fractional part are accepted as integers.
long long ParseBoundedInt(const nlohmann::json& raw, const IntField& field);

}  // namespace toolguard::input

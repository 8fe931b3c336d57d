#include "input/bounded_input.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

#include "errors/tool_error.hpp"

namespace toolguard::input {
namespace {

using errors::ToolError;
using errors::ToolErrorCode;

[[noreturn]] void ThrowNotInteger(const IntField& field) {
    throw ToolError(ToolErrorCode::kInvalidInput,
                    std::string(field.name) + " must be an integer",
                    {{"field", field.name}});
}

[[noreturn]] void ThrowOutOfRange(const IntField& field) {
    throw ToolError(ToolErrorCode::kInvalidInput,
                    std::string(field.name) + " must be between " + std::to_string(field.min)
                        + " and " + std::to_string(field.max),
                    {{"field", field.name}, {"min", field.min}, {"max", field.max}});
}

}  // namespace

void RequireObject(const nlohmann::json& raw) {
    if (!raw.is_object()) {
        throw ToolError(ToolErrorCode::kInvalidInput, "arguments must be an object");
    }
}

void RejectUnknownFields(const nlohmann::json& raw, const std::vector<std::string>& known) {
    for (const auto& item : raw.items()) {
        if (std::find(known.begin(), known.end(), item.key()) == known.end()) {
            throw ToolError(ToolErrorCode::kInvalidInput,
                            "unknown field: " + item.key(),
                            {{"field", item.key()}, {"allowed", known}});
        }
    }
}

const nlohmann::json* FindField(const nlohmann::json& raw, const char* name) {
    const auto it = raw.find(name);
    if (it == raw.end()) {
        return nullptr;
    }
    return &*it;
}

long long ParseBoundedInt(const nlohmann::json& raw, const IntField& field) {
    const auto* value = FindField(raw, field.name);
    if (!value) {
        return field.default_value;
    }
    if (value->is_number_unsigned()) {
        const auto number = value->get<std::uint64_t>();
        if (number > static_cast<std::uint64_t>(field.max)) {
            ThrowOutOfRange(field);
        }
        const auto result = static_cast<long long>(number);
        if (result < field.min) {
            ThrowOutOfRange(field);
        }
        return result;
    }
    if (value->is_number_integer()) {
        const auto number = value->get<long long>();
        if (number < field.min || number > field.max) {
            ThrowOutOfRange(field);
        }
        return number;
    }
    if (value->is_number_float()) {
        const auto number = value->get<double>();
        if (!std::isfinite(number) || std::trunc(number) != number) {
            ThrowNotInteger(field);
        }
        if (number < static_cast<double>(field.min) || number > static_cast<double>(field.max)) {
            ThrowOutOfRange(field);
        }
        return static_cast<long long>(number);
    }
    ThrowNotInteger(field);
}

}  // namespace toolguard::input

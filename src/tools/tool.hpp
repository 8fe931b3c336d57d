#pragma once

#include <string>

#include "nlohmann/json.hpp"
#include "utils/cancellation.hpp"

namespace toolguard::tools {

// `text` is the JSON envelope, pretty-printed: {"ok": true, ...} on success,
// {"ok": false, "error": {code, message, details?}} on failure.
struct ToolResult {
    bool is_error = false;
    std::string text;
};

ToolResult OkResult(const nlohmann::json& payload);
ToolResult ErrorResult(const nlohmann::json& error);

class Tool {
public:
    virtual ~Tool() = default;
    virtual std::string Name() const = 0;
    virtual std::string Description() const = 0;
    virtual std::string ParametersJson() const = 0;
    virtual ToolResult Execute(const nlohmann::json& arguments,
                               const utils::CancellationToken& cancel) = 0;
};

}  // namespace toolguard::tools

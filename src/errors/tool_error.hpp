#pragma once

#include <stdexcept>
#include <string>

#include "nlohmann/json.hpp"

namespace toolguard::errors {

enum class ToolErrorCode {
    kInvalidInput,
    kCommandNotAllowed,
    kDisallowedArgument,
    kSpawnFailed,
    kExecFailed,
    kTimeout,
    kNonZeroExit,
    kAborted,
    kInvalidUrl,
    kSsrfBlocked,
    kDnsFailed,
    kFetchFailed,
    kTooManyRedirects,
    kUnknownTool,
    kInternalError
};

const char* ToString(ToolErrorCode code);

// The one failure type thrown by both engines. `details` is null when the
// failure carries no payload.
class ToolError : public std::runtime_error {
public:
    ToolError(ToolErrorCode code, const std::string& message,
              nlohmann::json details = nullptr);

    ToolErrorCode Code() const { return code_; }
    const nlohmann::json& Details() const { return details_; }

    nlohmann::json ToJson() const;

private:
    ToolErrorCode code_;
    nlohmann::json details_;
};

}  // namespace toolguard::errors

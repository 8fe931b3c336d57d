#include "errors/tool_error.hpp"

#include <utility>

namespace toolguard::errors {

const char* ToString(ToolErrorCode code) {
    switch (code) {
        case ToolErrorCode::kInvalidInput: return "INVALID_INPUT";
        case ToolErrorCode::kCommandNotAllowed: return "COMMAND_NOT_ALLOWED";
        case ToolErrorCode::kDisallowedArgument: return "DISALLOWED_ARGUMENT";
        case ToolErrorCode::kSpawnFailed: return "SPAWN_FAILED";
        case ToolErrorCode::kExecFailed: return "EXEC_FAILED";
        case ToolErrorCode::kTimeout: return "TIMEOUT";
        case ToolErrorCode::kNonZeroExit: return "NON_ZERO_EXIT";
        case ToolErrorCode::kAborted: return "ABORTED";
        case ToolErrorCode::kInvalidUrl: return "INVALID_URL";
        case ToolErrorCode::kSsrfBlocked: return "SSRF_BLOCKED";
        case ToolErrorCode::kDnsFailed: return "DNS_FAILED";
        case ToolErrorCode::kFetchFailed: return "FETCH_FAILED";
        case ToolErrorCode::kTooManyRedirects: return "TOO_MANY_REDIRECTS";
        case ToolErrorCode::kUnknownTool: return "UNKNOWN_TOOL";
        case ToolErrorCode::kInternalError: return "INTERNAL_ERROR";
    }
    return "INTERNAL_ERROR";
}

ToolError::ToolError(ToolErrorCode code, const std::string& message, nlohmann::json details)
    : std::runtime_error(message)
    , code_(code)
    , details_(std::move(details)) {}

nlohmann::json ToolError::ToJson() const {
    nlohmann::json error = {
        {"code", ToString(code_)},
        {"message", what()}
    };
    if (!details_.is_null()) {
        error["details"] = details_;
    }
    return error;
}

}  // namespace toolguard::errors

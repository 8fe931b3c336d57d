#pragma once

#include "nlohmann/json.hpp"
#include "sandbox/exec_types.hpp"

namespace toolguard::sandbox {

// Decodes an untrusted exec request {command, args?, stdin?, timeoutMs?,
// maxOutputBytes?} into an ExecCommand. Throws ToolError with
// INVALID_INPUT, COMMAND_NOT_ALLOWED or DISALLOWED_ARGUMENT. Pure: no
// process is spawned here.
ExecCommand ParseExecInput(const nlohmann::json& raw);

}  // namespace toolguard::sandbox

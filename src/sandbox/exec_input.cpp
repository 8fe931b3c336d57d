#include "sandbox/exec_input.hpp"

#include <string>
#include <vector>

#include "errors/tool_error.hpp"
#include "input/bounded_input.hpp"
#include "sandbox/command_policy.hpp"

namespace toolguard::sandbox {
namespace {

using errors::ToolError;
using errors::ToolErrorCode;

const std::vector<std::string> kKnownFields = {
    "command", "args", "stdin", "timeoutMs", "maxOutputBytes"
};

std::vector<std::string> ParseArgs(const nlohmann::json& raw) {
    const auto* value = input::FindField(raw, "args");
    if (!value) {
        return {};
    }
    if (!value->is_array()) {
        throw ToolError(ToolErrorCode::kInvalidInput, "args must be an array of strings",
                        {{"field", "args"}});
    }
    for (const auto& item : *value) {
        if (!item.is_string()) {
            throw ToolError(ToolErrorCode::kInvalidInput, "args must be an array of strings",
                            {{"field", "args"}});
        }
    }
    if (value->size() > kMaxArgs) {
        throw ToolError(ToolErrorCode::kInvalidInput,
                        "args length must be <= " + std::to_string(kMaxArgs),
                        {{"field", "args"}, {"maxArgs", kMaxArgs}});
    }

    std::vector<std::string> args;
    args.reserve(value->size());
    for (const auto& item : *value) {
        auto arg = item.get<std::string>();
        if (arg.size() > kMaxArgLength) {
            throw ToolError(ToolErrorCode::kInvalidInput,
                            "arg too long (>" + std::to_string(kMaxArgLength) + ")",
                            {{"field", "args"}, {"maxArgLength", kMaxArgLength}});
        }
        if (arg.find('\0') != std::string::npos) {
            throw ToolError(ToolErrorCode::kInvalidInput, "args must not contain NUL bytes",
                            {{"field", "args"}});
        }
        args.push_back(std::move(arg));
    }
    return args;
}

}  // namespace

ExecCommand ParseExecInput(const nlohmann::json& raw) {
    input::RequireObject(raw);
    input::RejectUnknownFields(raw, kKnownFields);

    const auto* command_value = input::FindField(raw, "command");
    const auto command_name = command_value && command_value->is_string()
        ? command_value->get<std::string>()
        : std::string();

    ExecCommand command;
    command.command = CommandPolicy::RequireAllowed(command_name);
    command.args = ParseArgs(raw);
    CommandPolicy::ValidateArguments(command.command, command.args);

    command.timeout = std::chrono::milliseconds(input::ParseBoundedInt(
        raw, {"timeoutMs", 1, kMaxExecTimeoutMs, kDefaultExecTimeoutMs}));
    command.max_output_bytes = static_cast<std::size_t>(input::ParseBoundedInt(
        raw, {"maxOutputBytes", kMinMaxOutputBytes, kMaxMaxOutputBytes, kDefaultMaxOutputBytes}));

    if (const auto* stdin_value = input::FindField(raw, "stdin")) {
        if (!stdin_value->is_string()) {
            throw ToolError(ToolErrorCode::kInvalidInput, "stdin must be a string",
                            {{"field", "stdin"}});
        }
        auto text = stdin_value->get<std::string>();
        if (text.size() > kMaxStdinBytes) {
            throw ToolError(ToolErrorCode::kInvalidInput,
                            "stdin too large (>" + std::to_string(kMaxStdinBytes) + " bytes)",
                            {{"field", "stdin"}, {"maxStdinBytes", kMaxStdinBytes}});
        }
        command.stdin_text = std::move(text);
    }
    return command;
}

}  // namespace toolguard::sandbox

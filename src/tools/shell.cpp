#include "tools/shell.hpp"

#include "errors/tool_error.hpp"
#include "sandbox/exec_input.hpp"
#include "utils/logging.hpp"

namespace toolguard::tools {

ExecTool::ExecTool(sandbox::SandboxOptions options)
    : executor_(std::move(options)) {}

std::string ExecTool::Description() const {
    return "Run an allowlisted command (git/npm/node) with fixed cwd="
        + executor_.Options().working_dir + ", timeout, and output caps.";
}

std::string ExecTool::ParametersJson() const {
    const nlohmann::json schema = {
        {"type", "object"},
        {"additionalProperties", false},
        {"required", nlohmann::json::array({"command"})},
        {"properties", {
            {"command", {{"type", "string"}, {"enum", sandbox::AllowedCommandNames()}}},
            {"args", {{"type", "array"}, {"items", {{"type", "string"}}}, {"default", nlohmann::json::array()}}},
            {"stdin", {{"type", "string"}}},
            {"timeoutMs", {{"type", "integer"}, {"minimum", 1},
                           {"maximum", sandbox::kMaxExecTimeoutMs},
                           {"default", sandbox::kDefaultExecTimeoutMs}}},
            {"maxOutputBytes", {{"type", "integer"}, {"minimum", sandbox::kMinMaxOutputBytes},
                                {"maximum", sandbox::kMaxMaxOutputBytes},
                                {"default", sandbox::kDefaultMaxOutputBytes}}}
        }}
    };
    return schema.dump();
}

ToolResult ExecTool::Execute(const nlohmann::json& arguments,
                             const utils::CancellationToken& cancel) {
    try {
        const auto command = sandbox::ParseExecInput(arguments);
        return OkResult(sandbox::ToJson(executor_.Run(command, cancel)));
    } catch (const errors::ToolError& ex) {
        utils::Log(utils::LogLevel::kInfo, "exec", "failed",
                   {{"code", errors::ToString(ex.Code())}, {"message", ex.what()}});
        return ErrorResult(ex.ToJson());
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "exec", "internal error", {{"message", ex.what()}});
        return ErrorResult({{"code", "INTERNAL_ERROR"}, {"message", ex.what()}});
    }
}

}  // namespace toolguard::tools

#pragma once

#include <string>

#include "sandbox/sandbox_executor.hpp"
#include "tools/tool.hpp"

namespace toolguard::tools {

class ExecTool : public Tool {
public:
    explicit ExecTool(sandbox::SandboxOptions options);

    std::string Name() const override { return "exec"; }
    std::string Description() const override;
    std::string ParametersJson() const override;
    ToolResult Execute(const nlohmann::json& arguments,
                       const utils::CancellationToken& cancel) override;

private:
    sandbox::SandboxExecutor executor_;
};

}  // namespace toolguard::tools

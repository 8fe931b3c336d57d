#include "tools/tool_registry.hpp"

#include "errors/tool_error.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace toolguard::tools {

void ToolRegistry::Register(std::unique_ptr<Tool> tool) {
    auto name = tool->Name();
    tools_[std::move(name)] = std::move(tool);
}

Tool* ToolRegistry::Get(const std::string& name) {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return nullptr;
    }
    return it->second.get();
}

bool ToolRegistry::Has(const std::string& name) const {
    return tools_.find(name) != tools_.end();
}

nlohmann::json ToolRegistry::GetDefinitions() const {
    auto defs = nlohmann::json::array();
    for (const auto& [name, tool] : tools_) {
        defs.push_back({
            {"name", name},
            {"description", tool->Description()},
            {"inputSchema", nlohmann::json::parse(tool->ParametersJson())}
        });
    }
    return defs;
}

ToolResult ToolRegistry::Execute(const std::string& name,
                                 const nlohmann::json& arguments,
                                 const utils::CancellationToken& cancel) {
    auto tool = Get(name);
    if (!tool) {
        const errors::ToolError error(errors::ToolErrorCode::kUnknownTool, "Unknown tool: " + name);
        utils::Log(utils::LogLevel::kWarn, "tool", "unknown", {{"name", name}});
        return ErrorResult(error.ToJson());
    }
    utils::Log(utils::LogLevel::kInfo, "tool", "start",
               {{"name", name}, {"params", arguments.dump()}});
    const auto started = utils::Now();
    auto result = tool->Execute(arguments, cancel);
    utils::Log(utils::LogLevel::kInfo, "tool", "end",
               {{"name", name},
                {"error", result.is_error ? "true" : "false"},
                {"size", std::to_string(result.text.size())},
                {"duration_ms", std::to_string(utils::ElapsedMs(started))}});
    return result;
}

std::vector<std::string> ToolRegistry::List() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : tools_) {
        names.push_back(name);
    }
    return names;
}

}  // namespace toolguard::tools

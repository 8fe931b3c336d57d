#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "tools/tool.hpp"

namespace toolguard::tools {

class ToolRegistry {
public:
    void Register(std::unique_ptr<Tool> tool);
    Tool* Get(const std::string& name);
    bool Has(const std::string& name) const;

    // [{name, description, inputSchema}], ordered by name.
    nlohmann::json GetDefinitions() const;

    // Unknown names produce an UNKNOWN_TOOL error result.
    ToolResult Execute(const std::string& name,
                       const nlohmann::json& arguments,
                       const utils::CancellationToken& cancel = {});

    std::vector<std::string> List() const;

private:
    std::map<std::string, std::unique_ptr<Tool>> tools_;
};

}  // namespace toolguard::tools

#pragma once

#include <string>

#include "net/guarded_fetcher.hpp"
#include "tools/tool.hpp"

namespace toolguard::tools {

class FetchTool : public Tool {
public:
    explicit FetchTool(const net::GuardedFetcher& fetcher);

    std::string Name() const override { return "fetch"; }
    std::string Description() const override {
        return "HTTP(S) GET-only fetch with SSRF protections and strict caps.";
    }
    std::string ParametersJson() const override;
    ToolResult Execute(const nlohmann::json& arguments,
                       const utils::CancellationToken& cancel) override;

private:
    const net::GuardedFetcher& fetcher_;
};

}  // namespace toolguard::tools

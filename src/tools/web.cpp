#include "tools/web.hpp"

#include "errors/tool_error.hpp"
#include "net/fetch_input.hpp"
#include "utils/logging.hpp"

namespace toolguard::tools {

FetchTool::FetchTool(const net::GuardedFetcher& fetcher)
    : fetcher_(fetcher) {}

std::string FetchTool::ParametersJson() const {
    const nlohmann::json schema = {
        {"type", "object"},
        {"additionalProperties", false},
        {"required", nlohmann::json::array({"url"})},
        {"properties", {
            {"url", {{"type", "string"}}},
            {"timeoutMs", {{"type", "integer"}, {"minimum", 1},
                           {"maximum", net::kMaxFetchTimeoutMs},
                           {"default", net::kDefaultFetchTimeoutMs}}},
            {"maxBytes", {{"type", "integer"}, {"minimum", net::kMinMaxBytes},
                          {"maximum", net::kMaxMaxBytes},
                          {"default", net::kDefaultMaxBytes}}},
            {"maxRedirects", {{"type", "integer"}, {"minimum", 0},
                              {"maximum", net::kMaxMaxRedirects},
                              {"default", net::kDefaultMaxRedirects}}}
        }}
    };
    return schema.dump();
}

ToolResult FetchTool::Execute(const nlohmann::json& arguments,
                              const utils::CancellationToken& cancel) {
    try {
        const auto request = net::ParseFetchInput(arguments);
        return OkResult(net::ToJson(fetcher_.Fetch(request, cancel)));
    } catch (const errors::ToolError& ex) {
        utils::Log(utils::LogLevel::kInfo, "fetch", "failed",
                   {{"code", errors::ToString(ex.Code())}, {"message", ex.what()}});
        return ErrorResult(ex.ToJson());
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "fetch", "internal error", {{"message", ex.what()}});
        return ErrorResult({{"code", "INTERNAL_ERROR"}, {"message", ex.what()}});
    }
}

}  // namespace toolguard::tools

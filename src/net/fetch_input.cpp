#include "net/fetch_input.hpp"

#include <string>
#include <vector>

#include "errors/tool_error.hpp"
#include "input/bounded_input.hpp"

namespace toolguard::net {
namespace {

const std::vector<std::string> kKnownFields = {"url", "timeoutMs", "maxBytes", "maxRedirects"};

}  // namespace

FetchRequest ParseFetchInput(const nlohmann::json& raw) {
    input::RequireObject(raw);
    input::RejectUnknownFields(raw, kKnownFields);

    const auto* url = input::FindField(raw, "url");
    if (!url || !url->is_string() || url->get_ref<const std::string&>().empty()) {
        throw errors::ToolError(errors::ToolErrorCode::kInvalidInput, "url must be a non-empty string",
                                {{"field", "url"}});
    }

    FetchRequest request;
    request.url = url->get<std::string>();
    request.timeout = std::chrono::milliseconds(input::ParseBoundedInt(
        raw, {"timeoutMs", 1, kMaxFetchTimeoutMs, kDefaultFetchTimeoutMs}));
    request.max_bytes = static_cast<std::size_t>(input::ParseBoundedInt(
        raw, {"maxBytes", kMinMaxBytes, kMaxMaxBytes, kDefaultMaxBytes}));
    request.max_redirects = static_cast<int>(input::ParseBoundedInt(
        raw, {"maxRedirects", 0, kMaxMaxRedirects, kDefaultMaxRedirects}));
    return request;
}

}  // namespace toolguard::net

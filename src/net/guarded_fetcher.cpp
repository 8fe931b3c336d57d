#include "net/guarded_fetcher.hpp"

#include <algorithm>
#include <optional>

#include "errors/tool_error.hpp"
#include "utils/bounded_buffer.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace toolguard::net {
namespace {

using errors::ToolError;
using errors::ToolErrorCode;

std::optional<std::string> LastHeader(const HttpResponseHead& head, const std::string& name) {
    std::optional<std::string> value;
    for (const auto& [key, field] : head.headers) {
        if (utils::ToLower(key) == name) {
            value = field;
        }
    }
    return value;
}

std::map<std::string, std::string> FoldHeaders(const HttpResponseHead& head) {
    std::map<std::string, std::string> headers;
    for (const auto& [key, value] : head.headers) {
        headers[utils::ToLower(key)] = value;
    }
    return headers;
}

}  // namespace

GuardedFetcher::GuardedFetcher(const NetworkPolicy& policy, HttpTransport& transport,
                               std::string user_agent)
    : policy_(policy), transport_(transport), user_agent_(std::move(user_agent)) {}

FetchOutcome GuardedFetcher::Fetch(const FetchRequest& request,
                                   const utils::CancellationToken& cancel) const {
    const auto timeout = std::clamp(request.timeout,
                                    std::chrono::milliseconds(1),
                                    std::chrono::milliseconds(kMaxFetchTimeoutMs));
    const auto max_bytes = std::clamp<std::size_t>(request.max_bytes,
                                                   kMinMaxBytes,
                                                   kMaxMaxBytes);
    const int max_redirects = std::clamp<int>(request.max_redirects, 0,
                                              static_cast<int>(kMaxMaxRedirects));

    std::vector<RedirectHop> redirects;
    std::string current = request.url;
    for (int hop = 0; hop <= max_redirects; ++hop) {
        if (cancel.IsCancelled()) {
            throw ToolError(ToolErrorCode::kAborted, "Request aborted");
        }
        const auto target = policy_.Check(current);

        HttpRequestOptions options;
        options.deadline = utils::Now() + timeout;
        options.user_agent = user_agent_;

        HttpResponseHead head;
        utils::BoundedBuffer body(max_bytes);
        bool redirect = false;
        transport_.Get(target, options, cancel,
            [&](const HttpResponseHead& received) {
                head = received;
                redirect = IsRedirectStatus(received.status);
                return !redirect;
            },
            [&](const char* data, std::size_t size) {
                return body.Append(data, size);
            });

        utils::Log(utils::LogLevel::kInfo, "fetch", "response",
                   {{"hop", std::to_string(hop)},
                    {"status", std::to_string(head.status)},
                    {"url", target.ToString()}});

        if (redirect) {
            const auto location = LastHeader(head, "location");
            if (!location || location->empty()) {
                throw ToolError(ToolErrorCode::kFetchFailed, "Redirect response missing Location header",
                                {{"status", head.status}});
            }
            const auto next = ResolveReference(target.GetUrl(), *location);
            if (!next) {
                throw ToolError(ToolErrorCode::kFetchFailed, "Invalid redirect location",
                                {{"status", head.status}, {"location", *location}});
            }
            redirects.push_back({head.status, next->ToString()});
            current = next->ToString();
            continue;
        }

        FetchOutcome outcome;
        outcome.url = target.ToString();
        outcome.status = head.status;
        outcome.status_text = head.reason;
        outcome.ok = head.status >= 200 && head.status <= 299;
        outcome.headers = FoldHeaders(head);
        outcome.body = body.Text();
        outcome.truncated = body.Truncated();
        outcome.bytes_read = body.Size();
        outcome.redirects = std::move(redirects);
        return outcome;
    }

    utils::Log(utils::LogLevel::kWarn, "fetch", "redirect budget exhausted",
               {{"max_redirects", std::to_string(max_redirects)}});
    throw ToolError(ToolErrorCode::kTooManyRedirects, "Too many redirects",
                    {{"maxRedirects", max_redirects}, {"redirects", ToJson(redirects)}});
}

}  // namespace toolguard::net

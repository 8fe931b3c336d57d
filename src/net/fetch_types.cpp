#include "net/fetch_types.hpp"

namespace toolguard::net {

bool IsRedirectStatus(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

nlohmann::json ToJson(const RedirectHop& hop) {
    return {{"status", hop.status}, {"location", hop.location}};
}

nlohmann::json ToJson(const std::vector<RedirectHop>& hops) {
    auto out = nlohmann::json::array();
    for (const auto& hop : hops) {
        out.push_back(ToJson(hop));
    }
    return out;
}

nlohmann::json ToJson(const FetchOutcome& outcome) {
    return {
        {"url", outcome.url},
        {"status", outcome.status},
        {"statusText", outcome.status_text},
        {"ok", outcome.ok},
        {"headers", outcome.headers},
        {"body", outcome.body},
        {"truncated", outcome.truncated},
        {"bytesRead", outcome.bytes_read},
        {"redirects", ToJson(outcome.redirects)}
    };
}

}  // namespace toolguard::net

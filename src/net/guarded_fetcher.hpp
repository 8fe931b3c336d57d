#pragma once

#include <string>

#include "net/fetch_types.hpp"
#include "net/http_transport.hpp"
#include "net/network_policy.hpp"
#include "utils/cancellation.hpp"

namespace toolguard::net {

// GET with manual redirect handling. Each hop, the first included, goes
// through NetworkPolicy again before anything is sent, so a redirect can
// never reach a target the policy would have refused up front.
class GuardedFetcher {
public:
    GuardedFetcher(const NetworkPolicy& policy, HttpTransport& transport,
                   std::string user_agent = kDefaultUserAgent);

    // Throws ToolError: INVALID_URL, SSRF_BLOCKED, DNS_FAILED, FETCH_FAILED,
    // TOO_MANY_REDIRECTS or ABORTED.
    FetchOutcome Fetch(const FetchRequest& request,
                       const utils::CancellationToken& cancel = {}) const;

private:
    const NetworkPolicy& policy_;
    HttpTransport& transport_;
    std::string user_agent_;
};

}  // namespace toolguard::net

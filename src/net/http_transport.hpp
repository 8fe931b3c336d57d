#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

#include "net/network_policy.hpp"
#include "utils/cancellation.hpp"

namespace toolguard::net {

struct HttpResponseHead {
    int status = 0;
    std::string reason;
    // In arrival order; repeated names appear more than once.
    std::vector<std::pair<std::string, std::string>> headers;
};

struct HttpRequestOptions {
    std::chrono::steady_clock::time_point deadline;
    std::string user_agent;
};

// Return false to stop reading; the connection is then dropped.
using HeadCallback = std::function<bool(const HttpResponseHead&)>;
using BodyCallback = std::function<bool(const char* data, std::size_t size)>;

// One GET per call, never following redirects. Connects only to the
// addresses carried by the ResolvedUrl.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Throws ToolError: ABORTED when `cancel` fires, FETCH_FAILED for any
    // other failure including the deadline.
    virtual void Get(const ResolvedUrl& target,
                     const HttpRequestOptions& options,
                     const utils::CancellationToken& cancel,
                     const HeadCallback& on_head,
                     const BodyCallback& on_body) = 0;
};

}  // namespace toolguard::net

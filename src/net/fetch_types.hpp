#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace toolguard::net {

constexpr long long kDefaultFetchTimeoutMs = 15000;
constexpr long long kMaxFetchTimeoutMs = 30000;
constexpr long long kMinMaxBytes = 1024;
constexpr long long kDefaultMaxBytes = 500000;
constexpr long long kMaxMaxBytes = 1000000;
constexpr long long kDefaultMaxRedirects = 3;
constexpr long long kMaxMaxRedirects = 5;

constexpr const char* kDefaultUserAgent = "toolguard-fetch/0.1";

struct FetchRequest {
    std::string url;
    std::chrono::milliseconds timeout{kDefaultFetchTimeoutMs};
    std::size_t max_bytes = static_cast<std::size_t>(kDefaultMaxBytes);
    int max_redirects = static_cast<int>(kDefaultMaxRedirects);
};

struct RedirectHop {
    int status = 0;
    std::string location;  // absolute
};

struct FetchOutcome {
    std::string url;
    int status = 0;
    std::string status_text;
    bool ok = false;
    std::map<std::string, std::string> headers;
    std::string body;
    bool truncated = false;
    std::size_t bytes_read = 0;
    std::vector<RedirectHop> redirects;
};

bool IsRedirectStatus(int status);

nlohmann::json ToJson(const RedirectHop& hop);
nlohmann::json ToJson(const std::vector<RedirectHop>& hops);

// Wire shape: {url, status, statusText, ok, headers, body, truncated,
// bytesRead, redirects}.
nlohmann::json ToJson(const FetchOutcome& outcome);

}  // namespace toolguard::net

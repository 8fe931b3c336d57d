#include "net/network_policy.hpp"

#include <algorithm>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/system/system_error.hpp>

#include "errors/tool_error.hpp"
#include "net/ip_address.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace toolguard::net {
namespace {

using errors::ToolError;
using errors::ToolErrorCode;

const std::vector<std::string> kBuiltinBlockedSuffixes = {".localhost", ".local", ".internal"};

std::string DisplayHost(const Url& url) {
    return url.host_is_ipv6 ? "[" + url.host + "]" : url.host;
}

std::string NormalizeSuffix(const std::string& suffix) {
    auto normalized = utils::ToLower(suffix);
    while (!normalized.empty() && normalized.back() == '.') {
        normalized.pop_back();
    }
    if (!normalized.empty() && normalized.front() != '.') {
        normalized.insert(normalized.begin(), '.');
    }
    return normalized;
}

[[noreturn]] void Deny(const std::string& message, nlohmann::json details) {
    utils::Log(utils::LogLevel::kWarn, "fetch", "policy denied",
               {{"reason", message}, {"details", details.dump()}});
    throw ToolError(ToolErrorCode::kSsrfBlocked, message, std::move(details));
}

}  // namespace

std::vector<boost::asio::ip::address> AsioHostResolver::Resolve(const std::string& host) {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver(ioc);
    boost::system::error_code ec;
    const auto results = resolver.resolve(host, "", ec);
    if (ec) {
        throw boost::system::system_error(ec);
    }
    std::vector<boost::asio::ip::address> addresses;
    for (const auto& entry : results) {
        const auto address = entry.endpoint().address();
        if (std::find(addresses.begin(), addresses.end(), address) == addresses.end()) {
            addresses.push_back(address);
        }
    }
    return addresses;
}

ResolvedUrl::ResolvedUrl(Url url, std::string hostname,
                         std::vector<boost::asio::ip::address> addresses, bool host_is_ip)
    : url_(std::move(url))
    , hostname_(std::move(hostname))
    , addresses_(std::move(addresses))
    , host_is_ip_(host_is_ip) {}

std::string NormalizeHostname(const std::string& host) {
    auto normalized = utils::ToLower(PercentDecode(host));
    if (!normalized.empty() && normalized.back() == '.') {
        normalized.pop_back();
    }
    return normalized;
}

NetworkPolicy::NetworkPolicy(HostResolver& resolver, std::vector<std::string> extra_blocked_suffixes)
    : resolver_(resolver), blocked_suffixes_(kBuiltinBlockedSuffixes) {
    for (const auto& suffix : extra_blocked_suffixes) {
        const auto normalized = NormalizeSuffix(suffix);
        if (normalized.size() > 1) {
            blocked_suffixes_.push_back(normalized);
        }
    }
}

bool NetworkPolicy::IsBlockedHostname(const std::string& hostname) const {
    const auto host = NormalizeHostname(hostname);
    if (host == "localhost") {
        return true;
    }
    for (const auto& suffix : blocked_suffixes_) {
        if (utils::EndsWith(host, suffix) || host == suffix.substr(1)) {
            return true;
        }
    }
    return false;
}

ResolvedUrl NetworkPolicy::Check(const std::string& url) const {
    const auto parsed = ParseUrl(url);
    if (!parsed) {
        throw ToolError(ToolErrorCode::kInvalidUrl, "Invalid URL");
    }
    return Check(*parsed);
}

ResolvedUrl NetworkPolicy::Check(const Url& url) const {
    if (url.scheme != "http" && url.scheme != "https") {
        throw ToolError(ToolErrorCode::kInvalidUrl, "Only http:// and https:// URLs are allowed",
                        {{"protocol", url.scheme + ":"}});
    }
    if (url.HasCredentials()) {
        throw ToolError(ToolErrorCode::kInvalidUrl, "Userinfo in URL is not allowed");
    }
    if (url.host.empty()) {
        throw ToolError(ToolErrorCode::kInvalidUrl, "URL hostname is required");
    }

    const auto hostname = NormalizeHostname(url.host);
    if (hostname.empty()) {
        throw ToolError(ToolErrorCode::kInvalidUrl, "URL hostname is required");
    }
    if (IsBlockedHostname(hostname)) {
        Deny("Blocked hostname", {{"hostname", DisplayHost(url)}});
    }

    if (DetectIpVersion(hostname) != IpVersion::kNone) {
        if (IsPrivateIp(hostname)) {
            Deny("Blocked IP address", {{"host", DisplayHost(url)}});
        }
        boost::system::error_code ec;
        const auto address = boost::asio::ip::make_address(hostname, ec);
        if (ec) {
            // Parsed by our own reader but not by asio (zone ids and the like).
            Deny("Blocked IP address", {{"host", DisplayHost(url)}});
        }
        return ResolvedUrl(url, hostname, {address}, true);
    }

    std::vector<boost::asio::ip::address> addresses;
    try {
        addresses = resolver_.Resolve(hostname);
    } catch (const boost::system::system_error& ex) {
        throw ToolError(ToolErrorCode::kDnsFailed, "DNS lookup failed",
                        {{"hostname", hostname}, {"message", ex.code().message()}});
    }
    if (addresses.empty()) {
        throw ToolError(ToolErrorCode::kDnsFailed, "DNS lookup failed",
                        {{"hostname", hostname}, {"message", "no addresses returned"}});
    }
    for (const auto& address : addresses) {
        if (IsPrivateAddress(address)) {
            Deny("Blocked resolved IP address",
                 {{"hostname", hostname}, {"address", address.to_string()}});
        }
    }

    utils::Log(utils::LogLevel::kDebug, "fetch", "resolved",
               {{"hostname", hostname}, {"addresses", std::to_string(addresses.size())}});
    return ResolvedUrl(url, hostname, std::move(addresses), false);
}

}  // namespace toolguard::net

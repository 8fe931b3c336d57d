#pragma once

#include <string>
#include <vector>

#include <boost/asio/ip/address.hpp>

#include "net/url.hpp"

namespace toolguard::net {

class HostResolver {
public:
    virtual ~HostResolver() = default;

    // All A/AAAA answers for `host`. Throws boost::system::system_error on
    // lookup failure; an empty answer is returned as-is.
    virtual std::vector<boost::asio::ip::address> Resolve(const std::string& host) = 0;
};

// Blocking resolver backed by boost::asio::ip::tcp::resolver.
class AsioHostResolver : public HostResolver {
public:
    std::vector<boost::asio::ip::address> Resolve(const std::string& host) override;
};

// A URL that passed NetworkPolicy::Check, together with the addresses that
// were validated for it. Connections go to these addresses only.
class ResolvedUrl {
public:
    const Url& GetUrl() const { return url_; }
    const std::string& Hostname() const { return hostname_; }
    const std::vector<boost::asio::ip::address>& Addresses() const { return addresses_; }
    bool HostIsIp() const { return host_is_ip_; }
    std::string ToString() const { return url_.ToString(); }

private:
    friend class NetworkPolicy;
    // Defined by the transport tests to target loopback listeners.
    friend struct ResolvedUrlTestAccess;
    ResolvedUrl(Url url, std::string hostname,
                std::vector<boost::asio::ip::address> addresses, bool host_is_ip);

    Url url_;
    std::string hostname_;
    std::vector<boost::asio::ip::address> addresses_;
    bool host_is_ip_;
};

// Decides whether a URL may be fetched. Every check throws ToolError with
// INVALID_URL, SSRF_BLOCKED or DNS_FAILED.
class NetworkPolicy {
public:
    NetworkPolicy(HostResolver& resolver, std::vector<std::string> extra_blocked_suffixes = {});

    ResolvedUrl Check(const std::string& url) const;
    ResolvedUrl Check(const Url& url) const;

    bool IsBlockedHostname(const std::string& hostname) const;

private:
    HostResolver& resolver_;
    std::vector<std::string> blocked_suffixes_;
};

// Lower-cased, percent-decoded, trailing dot removed.
std::string NormalizeHostname(const std::string& host);

}  // namespace toolguard::net

#pragma once

#include <optional>
#include <string>

namespace toolguard::net {

// Absolute http(s)-style URL after parsing and normalization. `host` is
// lower-cased and percent-decoded; an IPv6 host is stored without brackets.
// `port` is only set when it differs from the scheme default.
struct Url {
    std::string scheme;
    std::string username;
    std::string password;
    std::string host;
    bool host_is_ipv6 = false;
    std::optional<int> port;
    std::string path = "/";
    std::string query;     // without '?'
    std::string fragment;  // without '#'
    bool has_query = false;
    bool has_fragment = false;

    int EffectivePort() const;
    bool HasCredentials() const { return !username.empty() || !password.empty(); }
    bool IsSpecial() const;

    // host[:port] as it goes into the Host header.
    std::string HostHeader() const;
    // path[?query], the request target sent on the wire.
    std::string Target() const;
    std::string ToString() const;
};

int DefaultPort(const std::string& scheme);

// Returns nullopt for anything that is not an absolute URL with a scheme.
std::optional<Url> ParseUrl(const std::string& input);

// Resolves `reference` against `base` (RFC 3986 section 5.2).
std::optional<Url> ResolveReference(const Url& base, const std::string& reference);

std::string PercentDecode(const std::string& value);

// Browser-style IPv4 host canonicalization: "2130706433", "0x7f.1" and
// "0177.0.0.1" all become "127.0.0.1". Nullopt when the host is not
// numeric; `invalid` is set when it looks numeric but overflows.
std::optional<std::string> CanonicalizeIpv4Host(const std::string& host, bool* invalid);

}  // namespace toolguard::net

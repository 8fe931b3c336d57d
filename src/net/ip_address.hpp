#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

#include <boost/asio/ip/address.hpp>

namespace toolguard::net {

// 128-bit value held as two exact-width halves.
struct Uint128 {
    std::uint64_t high = 0;
    std::uint64_t low = 0;

    bool operator==(const Uint128& other) const {
        return high == other.high && low == other.low;
    }
};

using Ipv6Groups = std::array<std::uint16_t, 8>;

enum class IpVersion {
    kNone,
    kV4,
    kV6
};

// Strict dotted quad: four decimal parts of 1-3 digits, each <= 255.
std::optional<std::uint32_t> ParseIpv4(const std::string& text);

// Full IPv6 text form: `::` compression, an embedded IPv4 tail and an
// optional `%zone` suffix (ignored).
std::optional<Ipv6Groups> ParseIpv6(const std::string& text);

IpVersion DetectIpVersion(const std::string& text);

Uint128 ToUint128(const Ipv6Groups& groups);
std::string FormatIpv4(std::uint32_t value);

bool Ipv4InCidr(std::uint32_t address, std::uint32_t base, int prefix_bits);
bool Ipv6InCidr(const Uint128& address, const Uint128& base, int prefix_bits);

bool IsPrivateIpv4(std::uint32_t address);
bool IsPrivateIpv6(const Ipv6Groups& groups);

// True for loopback, private, link-local, CGNAT, documentation, benchmark,
// multicast and reserved ranges. Text that is not an IP address counts as
// private.
bool IsPrivateIp(const std::string& text);
bool IsPrivateAddress(const boost::asio::ip::address& address);

}  // namespace toolguard::net

#include "net/ip_address.hpp"

#include <cctype>
#include <vector>

namespace toolguard::net {
namespace {

struct Ipv4Range {
    std::uint32_t base;
    int prefix_bits;
};

constexpr std::uint32_t Ipv4(std::uint32_t a, std::uint32_t b, std::uint32_t c, std::uint32_t d) {
    return (a << 24) | (b << 16) | (c << 8) | d;
}

constexpr Ipv4Range kPrivateIpv4Ranges[] = {
    {Ipv4(0, 0, 0, 0), 8},
    {Ipv4(10, 0, 0, 0), 8},
    {Ipv4(100, 64, 0, 0), 10},
    {Ipv4(127, 0, 0, 0), 8},
    {Ipv4(169, 254, 0, 0), 16},
    {Ipv4(172, 16, 0, 0), 12},
    {Ipv4(192, 168, 0, 0), 16},
    {Ipv4(192, 0, 0, 0), 24},
    {Ipv4(192, 0, 2, 0), 24},
    {Ipv4(198, 18, 0, 0), 15},
    {Ipv4(198, 51, 100, 0), 24},
    {Ipv4(203, 0, 113, 0), 24},
    {Ipv4(224, 0, 0, 0), 4},
    {Ipv4(240, 0, 0, 0), 4},
};

struct Ipv6Range {
    Uint128 base;
    int prefix_bits;
};

const Ipv6Range kPrivateIpv6Ranges[] = {
    {{0xfc00000000000000ULL, 0}, 7},
    {{0xfe80000000000000ULL, 0}, 10},
    {{0xff00000000000000ULL, 0}, 8},
    {{0x20010db800000000ULL, 0}, 32},
};

// Prefixes that carry an IPv4 address in their low 32 bits.
const Uint128 kIpv4MappedPrefix{0, 0x0000ffff00000000ULL};  // ::ffff:0:0/96
const Uint128 kNat64Prefix{0x0064ff9b00000000ULL, 0};       // 64:ff9b::/96
const Uint128 kSixToFourPrefix{0x2002000000000000ULL, 0};   // 2002::/16

std::optional<std::uint16_t> ParseHexGroup(const std::string& group) {
    if (group.empty() || group.size() > 4) {
        return std::nullopt;
    }
    std::uint16_t value = 0;
    for (char ch : group) {
        const auto c = static_cast<unsigned char>(ch);
        if (!std::isxdigit(c)) {
            return std::nullopt;
        }
        const int digit = std::isdigit(c) ? c - '0' : std::tolower(c) - 'a' + 10;
        value = static_cast<std::uint16_t>((value << 4) | digit);
    }
    return value;
}

// Splits "a:b:c" into groups; an empty input yields no groups and an empty
// group anywhere is an error.
std::optional<std::vector<std::uint16_t>> ParseGroupList(const std::string& text) {
    std::vector<std::uint16_t> groups;
    if (text.empty()) {
        return groups;
    }
    std::size_t start = 0;
    while (true) {
        const auto colon = text.find(':', start);
        const auto part = text.substr(start, colon == std::string::npos ? std::string::npos : colon - start);
        const auto value = ParseHexGroup(part);
        if (!value) {
            return std::nullopt;
        }
        groups.push_back(*value);
        if (colon == std::string::npos) {
            break;
        }
        start = colon + 1;
    }
    return groups;
}

}  // namespace

std::optional<std::uint32_t> ParseIpv4(const std::string& text) {
    std::uint32_t value = 0;
    int parts = 0;
    std::size_t i = 0;
    while (parts < 4) {
        std::size_t digits = 0;
        std::uint32_t part = 0;
        while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])) && digits < 4) {
            part = part * 10 + static_cast<std::uint32_t>(text[i] - '0');
            ++digits;
            ++i;
        }
        if (digits == 0 || digits > 3 || part > 255) {
            return std::nullopt;
        }
        value = (value << 8) | part;
        ++parts;
        if (parts < 4) {
            if (i >= text.size() || text[i] != '.') {
                return std::nullopt;
            }
            ++i;
        }
    }
    if (i != text.size()) {
        return std::nullopt;
    }
    return value;
}

std::optional<Ipv6Groups> ParseIpv6(const std::string& text) {
    std::string input = text;
    const auto zone = input.find('%');
    if (zone != std::string::npos) {
        input = input.substr(0, zone);
    }
    if (input.empty() || input.find(':') == std::string::npos) {
        return std::nullopt;
    }

    // Replace an embedded IPv4 tail with two placeholder groups.
    std::optional<std::uint32_t> tail_v4;
    if (input.find('.') != std::string::npos) {
        const auto last_colon = input.rfind(':');
        tail_v4 = ParseIpv4(input.substr(last_colon + 1));
        if (!tail_v4) {
            return std::nullopt;
        }
        input = input.substr(0, last_colon + 1) + "0:0";
    }

    const auto gap = input.find("::");
    std::vector<std::uint16_t> groups;
    if (gap == std::string::npos) {
        const auto parsed = ParseGroupList(input);
        if (!parsed || parsed->size() != 8) {
            return std::nullopt;
        }
        groups = *parsed;
    } else {
        if (input.find("::", gap + 1) != std::string::npos) {
            return std::nullopt;
        }
        const auto head = ParseGroupList(input.substr(0, gap));
        const auto tail = ParseGroupList(input.substr(gap + 2));
        if (!head || !tail || head->size() + tail->size() > 7) {
            return std::nullopt;
        }
        groups = *head;
        groups.resize(8 - tail->size(), 0);
        groups.insert(groups.end(), tail->begin(), tail->end());
    }

    Ipv6Groups result{};
    for (std::size_t i = 0; i < 8; ++i) {
        result[i] = groups[i];
    }
    if (tail_v4) {
        result[6] = static_cast<std::uint16_t>((*tail_v4 >> 16) & 0xffff);
        result[7] = static_cast<std::uint16_t>(*tail_v4 & 0xffff);
    }
    return result;
}

IpVersion DetectIpVersion(const std::string& text) {
    if (ParseIpv4(text)) {
        return IpVersion::kV4;
    }
    if (ParseIpv6(text)) {
        return IpVersion::kV6;
    }
    return IpVersion::kNone;
}

Uint128 ToUint128(const Ipv6Groups& groups) {
    Uint128 value;
    for (std::size_t i = 0; i < 4; ++i) {
        value.high = (value.high << 16) | groups[i];
        value.low = (value.low << 16) | groups[i + 4];
    }
    return value;
}

std::string FormatIpv4(std::uint32_t value) {
    return std::to_string((value >> 24) & 0xff) + "." + std::to_string((value >> 16) & 0xff) + "."
        + std::to_string((value >> 8) & 0xff) + "." + std::to_string(value & 0xff);
}

bool Ipv4InCidr(std::uint32_t address, std::uint32_t base, int prefix_bits) {
    if (prefix_bits <= 0) {
        return true;
    }
    const std::uint32_t mask = prefix_bits >= 32 ? 0xffffffffu : ~(0xffffffffu >> prefix_bits);
    return (address & mask) == (base & mask);
}

bool Ipv6InCidr(const Uint128& address, const Uint128& base, int prefix_bits) {
    if (prefix_bits <= 0) {
        return true;
    }
    if (prefix_bits <= 64) {
        const std::uint64_t mask = prefix_bits == 64 ? ~0ULL : ~(~0ULL >> prefix_bits);
        return (address.high & mask) == (base.high & mask);
    }
    if (address.high != base.high) {
        return false;
    }
    const int low_bits = prefix_bits - 64;
    const std::uint64_t mask = low_bits >= 64 ? ~0ULL : ~(~0ULL >> low_bits);
    return (address.low & mask) == (base.low & mask);
}

bool IsPrivateIpv4(std::uint32_t address) {
    for (const auto& range : kPrivateIpv4Ranges) {
        if (Ipv4InCidr(address, range.base, range.prefix_bits)) {
            return true;
        }
    }
    return false;
}

bool IsPrivateIpv6(const Ipv6Groups& groups) {
    const auto address = ToUint128(groups);
    if (address == Uint128{0, 0} || address == Uint128{0, 1}) {
        return true;
    }
    if (Ipv6InCidr(address, kIpv4MappedPrefix, 96) || Ipv6InCidr(address, kNat64Prefix, 96)) {
        return IsPrivateIpv4(static_cast<std::uint32_t>(address.low & 0xffffffffULL));
    }
    if (Ipv6InCidr(address, kSixToFourPrefix, 16)) {
        return IsPrivateIpv4(static_cast<std::uint32_t>((address.high >> 16) & 0xffffffffULL));
    }
    for (const auto& range : kPrivateIpv6Ranges) {
        if (Ipv6InCidr(address, range.base, range.prefix_bits)) {
            return true;
        }
    }
    return false;
}

bool IsPrivateIp(const std::string& text) {
    if (const auto v4 = ParseIpv4(text)) {
        return IsPrivateIpv4(*v4);
    }
    if (const auto v6 = ParseIpv6(text)) {
        return IsPrivateIpv6(*v6);
    }
    return true;
}

bool IsPrivateAddress(const boost::asio::ip::address& address) {
    if (address.is_v4()) {
        return IsPrivateIpv4(address.to_v4().to_uint());
    }
    const auto bytes = address.to_v6().to_bytes();
    Ipv6Groups groups{};
    for (std::size_t i = 0; i < 8; ++i) {
        groups[i] = static_cast<std::uint16_t>((bytes[2 * i] << 8) | bytes[2 * i + 1]);
    }
    return IsPrivateIpv6(groups);
}

}  // namespace toolguard::net

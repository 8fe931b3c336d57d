#include "net/url.hpp"

#include <cctype>
#include <cstdint>
#include <vector>

#include "net/ip_address.hpp"
#include "utils/common.hpp"

namespace toolguard::net {
namespace {

const char kHexDigits[] = "0123456789ABCDEF";

bool IsSpecialScheme(const std::string& scheme) {
    return scheme == "http" || scheme == "https" || scheme == "ws" || scheme == "wss"
        || scheme == "ftp" || scheme == "file";
}

bool IsSchemeChar(char ch) {
    const auto c = static_cast<unsigned char>(ch);
    return std::isalnum(c) || ch == '+' || ch == '-' || ch == '.';
}

// Position of the ':' ending a valid scheme, or npos.
std::size_t FindSchemeEnd(const std::string& input) {
    if (input.empty() || !std::isalpha(static_cast<unsigned char>(input[0]))) {
        return std::string::npos;
    }
    for (std::size_t i = 1; i < input.size(); ++i) {
        if (input[i] == ':') {
            return i;
        }
        if (!IsSchemeChar(input[i])) {
            return std::string::npos;
        }
    }
    return std::string::npos;
}

std::string StripControlAndWhitespace(const std::string& input) {
    std::size_t begin = 0;
    std::size_t end = input.size();
    while (begin < end && static_cast<unsigned char>(input[begin]) <= 0x20) {
        ++begin;
    }
    while (end > begin && static_cast<unsigned char>(input[end - 1]) <= 0x20) {
        --end;
    }
    std::string out;
    out.reserve(end - begin);
    for (std::size_t i = begin; i < end; ++i) {
        if (input[i] != '\t' && input[i] != '\n' && input[i] != '\r') {
            out.push_back(input[i]);
        }
    }
    return out;
}

enum class Component {
    kPath,
    kQuery,
    kFragment,
    kUserinfo
};

bool NeedsEncoding(unsigned char c, Component component) {
    if (c <= 0x20 || c >= 0x7f) {
        return true;
    }
    switch (component) {
        case Component::kFragment:
            return c == '"' || c == '<' || c == '>' || c == '`';
        case Component::kQuery:
            return c == '"' || c == '#' || c == '<' || c == '>' || c == '\'';
        case Component::kPath:
            return c == '"' || c == '#' || c == '<' || c == '>' || c == '?' || c == '`'
                || c == '{' || c == '}';
        case Component::kUserinfo:
            return c == '"' || c == '#' || c == '<' || c == '>' || c == '?' || c == '`'
                || c == '{' || c == '}' || c == '/' || c == ':' || c == ';' || c == '='
                || c == '@' || c == '[' || c == '\\' || c == ']' || c == '^' || c == '|';
    }
    return false;
}

std::string PercentEncode(const std::string& value, Component component) {
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        const auto c = static_cast<unsigned char>(ch);
        if (NeedsEncoding(c, component)) {
            out.push_back('%');
            out.push_back(kHexDigits[c >> 4]);
            out.push_back(kHexDigits[c & 0x0f]);
        } else {
            out.push_back(ch);
        }
    }
    return out;
}

// Unlike utils::Split, keeps empty items: "a//b" has three segments.
std::vector<std::string> SplitAll(const std::string& value, char delimiter) {
    std::vector<std::string> items;
    std::size_t start = 0;
    while (true) {
        const auto pos = value.find(delimiter, start);
        if (pos == std::string::npos) {
            items.push_back(value.substr(start));
            return items;
        }
        items.push_back(value.substr(start, pos - start));
        start = pos + 1;
    }
}

bool IsSingleDot(const std::string& segment) {
    return segment == "." || utils::ToLower(segment) == "%2e";
}

bool IsDoubleDot(const std::string& segment) {
    const auto lower = utils::ToLower(segment);
    return lower == ".." || lower == ".%2e" || lower == "%2e." || lower == "%2e%2e";
}

// `path` starts with '/'.
std::string RemoveDotSegments(const std::string& path) {
    const auto segments = SplitAll(path.substr(1), '/');
    std::vector<std::string> output;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        const bool last = i + 1 == segments.size();
        if (IsDoubleDot(segments[i])) {
            if (!output.empty()) {
                output.pop_back();
            }
            if (last) {
                output.emplace_back();
            }
        } else if (IsSingleDot(segments[i])) {
            if (last) {
                output.emplace_back();
            }
        } else {
            output.push_back(segments[i]);
        }
    }
    return "/" + utils::Join(output, "/");
}

bool IsForbiddenHostChar(unsigned char c) {
    if (c <= 0x20 || c == 0x7f) {
        return true;
    }
    switch (c) {
        case '#': case '%': case '/': case ':': case '<': case '>': case '?':
        case '@': case '[': case '\\': case ']': case '^': case '|':
            return true;
        default:
            return false;
    }
}

bool ParseIpv4Number(const std::string& part, std::uint64_t* value) {
    std::string digits = part;
    int radix = 10;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        radix = 16;
        digits = digits.substr(2);
    } else if (digits.size() >= 2 && digits[0] == '0') {
        radix = 8;
        digits = digits.substr(1);
    }
    std::uint64_t result = 0;
    for (char ch : digits) {
        const auto c = static_cast<unsigned char>(ch);
        int digit = -1;
        if (std::isdigit(c)) {
            digit = c - '0';
        } else if (radix == 16 && std::isxdigit(c)) {
            digit = std::tolower(c) - 'a' + 10;
        }
        if (digit < 0 || digit >= radix) {
            return false;
        }
        // Saturate; anything above 2^32 is rejected by the caller anyway.
        if (result <= (1ULL << 40)) {
            result = result * static_cast<std::uint64_t>(radix) + static_cast<std::uint64_t>(digit);
        }
    }
    *value = result;
    return true;
}

bool EndsInNumber(const std::vector<std::string>& parts) {
    const auto& last = parts.back();
    if (last.empty()) {
        return false;
    }
    bool all_digits = true;
    for (char ch : last) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            all_digits = false;
            break;
        }
    }
    if (all_digits) {
        return true;
    }
    if (last.size() >= 2 && last[0] == '0' && (last[1] == 'x' || last[1] == 'X')) {
        for (std::size_t i = 2; i < last.size(); ++i) {
            if (!std::isxdigit(static_cast<unsigned char>(last[i]))) {
                return false;
            }
        }
        return true;
    }
    return false;
}

std::string FormatHost(const Url& url) {
    return url.host_is_ipv6 ? "[" + url.host + "]" : url.host;
}

std::string AuthorityPrefix(const Url& url) {
    std::string out = url.scheme + "://";
    if (url.HasCredentials()) {
        out += url.username;
        if (!url.password.empty()) {
            out += ":" + url.password;
        }
        out += "@";
    }
    out += FormatHost(url);
    if (url.port) {
        out += ":" + std::to_string(*url.port);
    }
    return out;
}

bool ParseHost(const std::string& raw, bool special, Url* url) {
    if (!raw.empty() && raw.front() == '[') {
        if (raw.back() != ']') {
            return false;
        }
        const auto inner = utils::ToLower(raw.substr(1, raw.size() - 2));
        if (inner.find('%') != std::string::npos || !ParseIpv6(inner)) {
            return false;
        }
        url->host = inner;
        url->host_is_ipv6 = true;
        return true;
    }
    if (!special) {
        url->host = raw;
        return true;
    }
    const auto decoded = utils::ToLower(PercentDecode(raw));
    for (char ch : decoded) {
        if (IsForbiddenHostChar(static_cast<unsigned char>(ch))) {
            return false;
        }
    }
    bool invalid = false;
    if (const auto ipv4 = CanonicalizeIpv4Host(decoded, &invalid)) {
        url->host = *ipv4;
        return true;
    }
    if (invalid) {
        return false;
    }
    url->host = decoded;
    return true;
}

bool ParsePort(const std::string& text, const std::string& scheme, Url* url) {
    if (text.empty()) {
        return true;
    }
    long value = 0;
    for (char ch : text) {
        if (!std::isdigit(static_cast<unsigned char>(ch))) {
            return false;
        }
        value = value * 10 + (ch - '0');
        if (value > 65535) {
            return false;
        }
    }
    if (value != DefaultPort(scheme)) {
        url->port = static_cast<int>(value);
    }
    return true;
}

bool ParseAuthority(const std::string& authority, bool special, Url* url) {
    std::string host_port = authority;
    const auto at = authority.rfind('@');
    if (at != std::string::npos) {
        const auto userinfo = authority.substr(0, at);
        host_port = authority.substr(at + 1);
        const auto colon = userinfo.find(':');
        url->username = PercentEncode(userinfo.substr(0, colon), Component::kUserinfo);
        if (colon != std::string::npos) {
            url->password = PercentEncode(userinfo.substr(colon + 1), Component::kUserinfo);
        }
    }

    std::string host_text = host_port;
    std::string port_text;
    if (!host_port.empty() && host_port.front() == '[') {
        const auto close = host_port.find(']');
        if (close == std::string::npos) {
            return false;
        }
        host_text = host_port.substr(0, close + 1);
        const auto rest = host_port.substr(close + 1);
        if (!rest.empty()) {
            if (rest.front() != ':') {
                return false;
            }
            port_text = rest.substr(1);
        }
    } else {
        const auto colon = host_port.find(':');
        if (colon != std::string::npos) {
            host_text = host_port.substr(0, colon);
            port_text = host_port.substr(colon + 1);
        }
    }

    return ParseHost(host_text, special, url) && ParsePort(port_text, url->scheme, url);
}

}  // namespace

int DefaultPort(const std::string& scheme) {
    if (scheme == "http" || scheme == "ws") {
        return 80;
    }
    if (scheme == "https" || scheme == "wss") {
        return 443;
    }
    if (scheme == "ftp") {
        return 21;
    }
    return -1;
}

bool Url::IsSpecial() const {
    return IsSpecialScheme(scheme);
}

int Url::EffectivePort() const {
    return port ? *port : DefaultPort(scheme);
}

std::string Url::HostHeader() const {
    return port ? FormatHost(*this) + ":" + std::to_string(*port) : FormatHost(*this);
}

std::string Url::Target() const {
    return has_query ? path + "?" + query : path;
}

std::string Url::ToString() const {
    std::string out;
    if (host.empty() && !IsSpecial()) {
        out = scheme + ":" + path;
    } else {
        out = AuthorityPrefix(*this) + path;
    }
    if (has_query) {
        out += "?" + query;
    }
    if (has_fragment) {
        out += "#" + fragment;
    }
    return out;
}

std::string PercentDecode(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()
            && std::isxdigit(static_cast<unsigned char>(value[i + 1]))
            && std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            out.push_back(value[i]);
        }
    }
    return out;
}

std::optional<std::string> CanonicalizeIpv4Host(const std::string& host, bool* invalid) {
    *invalid = false;
    auto parts = SplitAll(host, '.');
    if (parts.size() > 1 && parts.back().empty()) {
        parts.pop_back();
    }
    if (parts.empty() || !EndsInNumber(parts)) {
        return std::nullopt;
    }
    if (parts.size() > 4) {
        *invalid = true;
        return std::nullopt;
    }
    std::vector<std::uint64_t> numbers;
    for (const auto& part : parts) {
        std::uint64_t value = 0;
        if (part.empty() || !ParseIpv4Number(part, &value)) {
            *invalid = true;
            return std::nullopt;
        }
        numbers.push_back(value);
    }
    for (std::size_t i = 0; i + 1 < numbers.size(); ++i) {
        if (numbers[i] > 255) {
            *invalid = true;
            return std::nullopt;
        }
    }
    const std::uint64_t last_limit = 1ULL << (8 * (5 - numbers.size()));
    if (numbers.back() >= last_limit) {
        *invalid = true;
        return std::nullopt;
    }
    std::uint64_t address = numbers.back();
    for (std::size_t i = 0; i + 1 < numbers.size(); ++i) {
        address += numbers[i] << (8 * (3 - i));
    }
    return FormatIpv4(static_cast<std::uint32_t>(address));
}

std::optional<Url> ParseUrl(const std::string& input) {
    const auto text = StripControlAndWhitespace(input);
    const auto scheme_end = FindSchemeEnd(text);
    if (scheme_end == std::string::npos) {
        return std::nullopt;
    }

    Url url;
    url.scheme = utils::ToLower(text.substr(0, scheme_end));
    const bool special = url.IsSpecial();
    std::string rest = text.substr(scheme_end + 1);

    // Fragment and query come off first; they may contain '/' and '@'.
    const auto hash = rest.find('#');
    if (hash != std::string::npos) {
        url.has_fragment = true;
        url.fragment = PercentEncode(rest.substr(hash + 1), Component::kFragment);
        rest = rest.substr(0, hash);
    }
    const auto question = rest.find('?');
    if (question != std::string::npos) {
        url.has_query = true;
        url.query = PercentEncode(rest.substr(question + 1), Component::kQuery);
        rest = rest.substr(0, question);
    }

    if (special) {
        for (auto& ch : rest) {
            if (ch == '\\') {
                ch = '/';
            }
        }
        std::size_t slashes = 0;
        while (slashes < rest.size() && rest[slashes] == '/') {
            ++slashes;
        }
        rest = rest.substr(slashes);
    } else if (utils::StartsWith(rest, "//")) {
        rest = rest.substr(2);
    } else {
        url.path = PercentEncode(rest, Component::kPath);
        return url;
    }

    const auto slash = rest.find('/');
    const auto authority = rest.substr(0, slash);
    if (!ParseAuthority(authority, special, &url)) {
        return std::nullopt;
    }

    const auto path = slash == std::string::npos ? std::string("/") : rest.substr(slash);
    url.path = PercentEncode(RemoveDotSegments(path), Component::kPath);
    return url;
}

std::optional<Url> ResolveReference(const Url& base, const std::string& reference) {
    auto ref = StripControlAndWhitespace(reference);
    if (FindSchemeEnd(ref) != std::string::npos) {
        return ParseUrl(ref);
    }
    if (base.IsSpecial()) {
        for (auto& ch : ref) {
            if (ch == '\\') {
                ch = '/';
            }
        }
    }

    std::string without_fragment = AuthorityPrefix(base) + base.path;
    if (base.has_query) {
        without_fragment += "?" + base.query;
    }

    if (utils::StartsWith(ref, "//")) {
        return ParseUrl(base.scheme + ":" + ref);
    }
    if (utils::StartsWith(ref, "/")) {
        return ParseUrl(AuthorityPrefix(base) + ref);
    }
    if (ref.empty()) {
        return ParseUrl(without_fragment);
    }
    if (ref.front() == '#') {
        return ParseUrl(without_fragment + ref);
    }
    if (ref.front() == '?') {
        return ParseUrl(AuthorityPrefix(base) + base.path + ref);
    }
    const auto last_slash = base.path.rfind('/');
    const auto directory = last_slash == std::string::npos ? std::string("/")
                                                          : base.path.substr(0, last_slash + 1);
    return ParseUrl(AuthorityPrefix(base) + directory + ref);
}

}  // namespace toolguard::net

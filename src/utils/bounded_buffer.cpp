#include "utils/bounded_buffer.hpp"

namespace toolguard::utils {
namespace {

constexpr const char* kReplacementChar = "\xEF\xBF\xBD";

bool IsContinuation(unsigned char byte) {
    return (byte & 0xC0) == 0x80;
}

}  // namespace

BoundedBuffer::BoundedBuffer(std::size_t max_bytes)
    : max_bytes_(max_bytes) {}

bool BoundedBuffer::Append(const char* data, std::size_t size) {
    if (size == 0) {
        return !truncated_;
    }
    if (bytes_.size() >= max_bytes_) {
        truncated_ = true;
        return false;
    }
    const auto remaining = max_bytes_ - bytes_.size();
    if (size > remaining) {
        bytes_.append(data, remaining);
        truncated_ = true;
        return false;
    }
    bytes_.append(data, size);
    return !truncated_;
}

std::string BoundedBuffer::Text() const {
    return DecodeUtf8Lossy(bytes_);
}

std::string DecodeUtf8Lossy(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());
    std::size_t i = 0;
    const auto size = bytes.size();
    while (i < size) {
        const auto lead = static_cast<unsigned char>(bytes[i]);
        if (lead < 0x80) {
            out.push_back(static_cast<char>(lead));
            ++i;
            continue;
        }

        std::size_t needed = 0;
        unsigned char lower = 0x80;
        unsigned char upper = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            needed = 1;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            needed = 2;
            if (lead == 0xE0) lower = 0xA0;
            if (lead == 0xED) upper = 0x9F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            needed = 3;
            if (lead == 0xF0) lower = 0x90;
            if (lead == 0xF4) upper = 0x8F;
        } else {
            out += kReplacementChar;
            ++i;
            continue;
        }

        // Consume the longest valid prefix; an incomplete sequence is
        // replaced once as a whole.
        std::size_t consumed = 1;
        bool complete = true;
        for (std::size_t k = 0; k < needed; ++k) {
            const auto pos = i + consumed;
            if (pos >= size) {
                complete = false;
                break;
            }
            const auto byte = static_cast<unsigned char>(bytes[pos]);
            const bool in_range = k == 0 ? (byte >= lower && byte <= upper) : IsContinuation(byte);
            if (!in_range) {
                complete = false;
                break;
            }
            ++consumed;
        }
        if (complete) {
            out.append(bytes, i, consumed);
        } else {
            out += kReplacementChar;
        }
        i += consumed;
    }
    return out;
}

}  // namespace toolguard::utils

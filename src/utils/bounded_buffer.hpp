#pragma once

#include <cstddef>
#include <string>

namespace toolguard::utils {

// Accumulates bytes up to a fixed ceiling. A chunk that crosses the ceiling
// is cut exactly at it; everything after is dropped and the buffer is
// flagged truncated.
class BoundedBuffer {
public:
    explicit BoundedBuffer(std::size_t max_bytes);

    // Returns false once the buffer is full, so readers can stop early.
    bool Append(const char* data, std::size_t size);
    bool Append(const std::string& data) { return Append(data.data(), data.size()); }

    bool Full() const { return bytes_.size() >= max_bytes_; }
    bool Truncated() const { return truncated_; }
    std::size_t Size() const { return bytes_.size(); }
    const std::string& Bytes() const { return bytes_; }

    // The collected bytes as UTF-8 text; invalid sequences, including a
    // sequence split by the cut, become U+FFFD.
    std::string Text() const;

private:
    std::size_t max_bytes_;
    std::string bytes_;
    bool truncated_ = false;
};

std::string DecodeUtf8Lossy(const std::string& bytes);

}  // namespace toolguard::utils

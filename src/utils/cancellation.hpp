#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace toolguard::utils {

namespace detail {

struct CancellationState {
    std::mutex mutex;
    bool cancelled = false;
    std::uint64_t next_id = 1;
    std::map<std::uint64_t, std::function<void()>> callbacks;
};

}  // namespace detail

class CancellationToken;

// Keeps a callback attached to a token; detaches it on destruction. Once the
// destructor returns the callback is guaranteed not to be running.
class CancellationRegistration {
public:
    CancellationRegistration() = default;
    CancellationRegistration(std::shared_ptr<detail::CancellationState> state, std::uint64_t id);
    ~CancellationRegistration();

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;
    CancellationRegistration(CancellationRegistration&& other) noexcept;
    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept;

    void Reset();

private:
    std::shared_ptr<detail::CancellationState> state_;
    std::uint64_t id_ = 0;
};

// Read side of a cancellation signal. A default-constructed token is never
// cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    bool IsCancelled() const;

    // Callbacks run on the thread that calls Cancel(), under the state lock;
    // they must be short and must not touch the token. A callback subscribed
    // after cancellation runs immediately on the subscribing thread.
    CancellationRegistration Subscribe(std::function<void()> callback) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state);

    std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
public:
    CancellationSource();

    void Cancel();
    bool IsCancelled() const;
    CancellationToken Token() const;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

}  // namespace toolguard::utils

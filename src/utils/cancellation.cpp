#include "utils/cancellation.hpp"

#include <utility>

namespace toolguard::utils {

CancellationRegistration::CancellationRegistration(
    std::shared_ptr<detail::CancellationState> state, std::uint64_t id)
    : state_(std::move(state))
    , id_(id) {}

CancellationRegistration::~CancellationRegistration() {
    Reset();
}

CancellationRegistration::CancellationRegistration(CancellationRegistration&& other) noexcept
    : state_(std::move(other.state_))
    , id_(other.id_) {
    other.id_ = 0;
}

CancellationRegistration& CancellationRegistration::operator=(CancellationRegistration&& other) noexcept {
    if (this != &other) {
        Reset();
        state_ = std::move(other.state_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void CancellationRegistration::Reset() {
    if (state_ && id_ != 0) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->callbacks.erase(id_);
    }
    state_.reset();
    id_ = 0;
}

CancellationToken::CancellationToken(std::shared_ptr<detail::CancellationState> state)
    : state_(std::move(state)) {}

bool CancellationToken::IsCancelled() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

CancellationRegistration CancellationToken::Subscribe(std::function<void()> callback) const {
    if (!state_) {
        return {};
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    if (state_->cancelled) {
        lock.unlock();
        callback();
        return {};
    }
    const auto id = state_->next_id++;
    state_->callbacks.emplace(id, std::move(callback));
    return CancellationRegistration(state_, id);
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

void CancellationSource::Cancel() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->cancelled) {
        return;
    }
    state_->cancelled = true;
    for (auto& [id, callback] : state_->callbacks) {
        (void)id;
        callback();
    }
    state_->callbacks.clear();
}

bool CancellationSource::IsCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

CancellationToken CancellationSource::Token() const {
    return CancellationToken(state_);
}

}  // namespace toolguard::utils

/**
 * @file cancellation.cpp
 * @brief Implementation of cooperative cancellation
 *
 * @date 2025
 */

#include "warden/utils/cancellation.hpp"

#include <thread>

namespace warden {
namespace utils {

bool CancellationToken::IsCancelled() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::WaitFor(std::chrono::milliseconds duration) const {
    return WaitUntil(std::chrono::steady_clock::now() + duration);
}

bool CancellationToken::WaitUntil(std::chrono::steady_clock::time_point deadline) const {
    if (!state_) {
        std::this_thread::sleep_until(deadline);
        return false;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_until(lock, deadline, [this] { return state_->cancelled; });
}

CancellationSource::CancellationSource()
    : state_(std::make_shared<detail::CancellationState>()) {}

void CancellationSource::Cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

bool CancellationSource::IsCancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

} // namespace utils
} // namespace warden

// Copyright (c) 2026 changcheng967. All rights reserved.

#include <livecap/core/stopper.hpp>

namespace livecap::core {

Stopper::Stopper()
    : state_(std::make_shared<State>()) {}

void Stopper::wait() const {
    std::unique_lock lock(state_->mutex);
    state_->cv.wait(lock, [this] { return state_->stopped.load(std::memory_order_acquire); });
}

bool Stopper::wait_until(Clock::time_point deadline) const {
    std::unique_lock lock(state_->mutex);
    return state_->cv.wait_until(lock, deadline,
        [this] { return state_->stopped.load(std::memory_order_acquire); });
}

bool Stopper::stopped() const noexcept {
    return state_->stopped.load(std::memory_order_acquire);
}

void Stopper::stop() noexcept {
    {
        // Set under the lock so a waiter cannot miss the notification
        std::lock_guard lock(state_->mutex);
        state_->stopped.store(true, std::memory_order_release);
    }
    state_->cv.notify_all();
    state_->source.request_stop();
}

std::stop_token Stopper::token() const noexcept {
    return state_->source.get_token();
}

} // namespace livecap::core

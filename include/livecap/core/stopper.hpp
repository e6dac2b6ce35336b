// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stop_token>

namespace livecap::core {

// Cooperative stop signal shared by every task of a capture.
// Copies observe the same state; once stopped it never reverts.
class Stopper {
public:
    using Clock = std::chrono::steady_clock;

    Stopper();

    // Block until stopped
    void wait() const;

    // Block until stopped or the deadline passes; returns stopped()
    bool wait_until(Clock::time_point deadline) const;

    [[nodiscard]] bool stopped() const noexcept;

    // Set to stopped and wake every waiter (idempotent)
    void stop() noexcept;

    // Fires on stop(); aborts blocking requests of the holders
    [[nodiscard]] std::stop_token token() const noexcept;

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        std::atomic<bool> stopped{false};
        std::stop_source source;
    };

    std::shared_ptr<State> state_;
};

} // namespace livecap::core

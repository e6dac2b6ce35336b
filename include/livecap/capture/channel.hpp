// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace livecap::capture {

namespace detail {

template<typename T>
struct ChannelState {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::deque<T> queue;
    std::size_t senders{0};
    std::size_t receivers{0};
};

} // namespace detail

template<typename T> class Sender;
template<typename T> class Receiver;

template<typename T>
std::pair<Sender<T>, Receiver<T>> make_channel();

// Producing end of an unbounded queue. Copies count as separate producers;
// the channel is closed for receivers once every Sender is gone.
template<typename T>
class Sender {
public:
    Sender() = default;
    ~Sender() { close(); }

    Sender(const Sender& other) : state_(other.state_) { attach(); }
    Sender(Sender&& other) noexcept : state_(std::move(other.state_)) {}

    Sender& operator=(Sender other) noexcept {
        std::swap(state_, other.state_);
        return *this;
    }

    // Returns false when no Receiver remains; the value is discarded
    bool send(T value) {
        if (!state_) {
            return false;
        }
        {
            std::lock_guard lock(state_->mutex);
            if (state_->receivers == 0) {
                return false;
            }
            state_->queue.push_back(std::move(value));
        }
        state_->cv.notify_one();
        return true;
    }

    // Drop this producer early
    void close() noexcept {
        if (!state_) {
            return;
        }
        {
            std::lock_guard lock(state_->mutex);
            --state_->senders;
        }
        state_->cv.notify_all();
        state_.reset();
    }

private:
    friend std::pair<Sender<T>, Receiver<T>> make_channel<T>();

    explicit Sender(std::shared_ptr<detail::ChannelState<T>> state) : state_(std::move(state)) { attach(); }

    void attach() {
        if (state_) {
            std::lock_guard lock(state_->mutex);
            ++state_->senders;
        }
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

// Consuming end. Several Receivers may pull concurrently; each value is
// delivered to exactly one of them.
template<typename T>
class Receiver {
public:
    Receiver() = default;
    ~Receiver() { close(); }

    Receiver(const Receiver& other) : state_(other.state_) { attach(); }
    Receiver(Receiver&& other) noexcept : state_(std::move(other.state_)) {}

    Receiver& operator=(Receiver other) noexcept {
        std::swap(state_, other.state_);
        return *this;
    }

    // Block for the next value. Returns nullopt once the queue is drained and
    // every Sender is gone, or when `stoken` is triggered.
    std::optional<T> receive(std::stop_token stoken = {}) {
        if (!state_) {
            return std::nullopt;
        }
        std::unique_lock lock(state_->mutex);
        bool ready = state_->cv.wait(lock, stoken, [this] {
            return !state_->queue.empty() || state_->senders == 0;
        });
        if (!ready || state_->queue.empty()) {
            return std::nullopt;
        }
        T value = std::move(state_->queue.front());
        state_->queue.pop_front();
        return value;
    }

    std::optional<T> try_receive() {
        if (!state_) {
            return std::nullopt;
        }
        std::lock_guard lock(state_->mutex);
        if (state_->queue.empty()) {
            return std::nullopt;
        }
        T value = std::move(state_->queue.front());
        state_->queue.pop_front();
        return value;
    }

    // Drop this consumer; senders fail once no consumer remains
    void close() noexcept {
        if (!state_) {
            return;
        }
        {
            std::lock_guard lock(state_->mutex);
            if (--state_->receivers == 0) {
                state_->queue.clear();
            }
        }
        state_.reset();
    }

private:
    friend std::pair<Sender<T>, Receiver<T>> make_channel<T>();

    explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state) : state_(std::move(state)) { attach(); }

    void attach() {
        if (state_) {
            std::lock_guard lock(state_->mutex);
            ++state_->receivers;
        }
    }

    std::shared_ptr<detail::ChannelState<T>> state_;
};

template<typename T>
std::pair<Sender<T>, Receiver<T>> make_channel() {
    auto state = std::make_shared<detail::ChannelState<T>>();
    return {Sender<T>(state), Receiver<T>(state)};
}

} // namespace livecap::capture

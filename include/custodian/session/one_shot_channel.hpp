#pragma once
#include "custodian/core/result.hpp"
#include "custodian/core/failures.hpp"
#include "custodian/core/constants.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace custodian::session {

namespace detail {
    template<typename T>
    struct OneShotState {
        std::mutex mutex;
        std::condition_variable ready;
        std::optional<T> value;
        bool sender_alive = true;
        bool receiver_alive = true;
    };
}

template<typename T>
class OneShotSender;

template<typename T>
class OneShotReceiver;

/// A linked sender/receiver pair carrying exactly one value.
template<typename T>
[[nodiscard]] std::pair<OneShotSender<T>, OneShotReceiver<T>> MakeOneShotChannel();

/**
 * Sending end of a one-shot channel. Send succeeds at most once; dropping
 * an unused sender wakes the receiver with ChannelClosed.
 */
template<typename T>
class OneShotSender {
public:
    OneShotSender(OneShotSender&& other) noexcept
        : state_(std::move(other.state_)) {
    }

    OneShotSender& operator=(OneShotSender&& other) noexcept {
        if (this != &other) {
            Close();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    OneShotSender(const OneShotSender&) = delete;
    OneShotSender& operator=(const OneShotSender&) = delete;

    ~OneShotSender() {
        Close();
    }

    Result<Unit, CustodyFailure> Send(T value) {
        if (!state_) {
            return Result<Unit, CustodyFailure>::Err(
                CustodyFailure::ChannelClosed(std::string(ErrorMessages::CHANNEL_SENDER_USED)));
        }
        auto state = std::move(state_);
        {
            std::lock_guard lock(state->mutex);
            state->sender_alive = false;
            if (!state->receiver_alive) {
                return Result<Unit, CustodyFailure>::Err(
                    CustodyFailure::ChannelClosed("Receiver dropped before delivery"));
            }
            state->value.emplace(std::move(value));
        }
        state->ready.notify_all();
        return Result<Unit, CustodyFailure>::Ok(unit);
    }

    [[nodiscard]] bool IsUsed() const noexcept { return state_ == nullptr; }

private:
    explicit OneShotSender(std::shared_ptr<detail::OneShotState<T>> state) noexcept
        : state_(std::move(state)) {
    }

    void Close() noexcept {
        if (!state_) {
            return;
        }
        {
            std::lock_guard lock(state_->mutex);
            state_->sender_alive = false;
        }
        state_->ready.notify_all();
        state_.reset();
    }

    friend std::pair<OneShotSender<T>, OneShotReceiver<T>> MakeOneShotChannel<T>();

    std::shared_ptr<detail::OneShotState<T>> state_;
};

/**
 * Receiving end of a one-shot channel. Receive blocks until the value
 * arrives or the sender goes away; a delivered or closed receiver is spent.
 * Dropping the receiver destroys any undelivered value.
 */
template<typename T>
class OneShotReceiver {
public:
    OneShotReceiver(OneShotReceiver&& other) noexcept
        : state_(std::move(other.state_)) {
    }

    OneShotReceiver& operator=(OneShotReceiver&& other) noexcept {
        if (this != &other) {
            Close();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    OneShotReceiver(const OneShotReceiver&) = delete;
    OneShotReceiver& operator=(const OneShotReceiver&) = delete;

    ~OneShotReceiver() {
        Close();
    }

    Result<T, CustodyFailure> Receive() {
        if (!state_) {
            return Result<T, CustodyFailure>::Err(
                CustodyFailure::ChannelClosed(std::string(ErrorMessages::CHANNEL_RECEIVER_USED)));
        }
        std::unique_lock lock(state_->mutex);
        state_->ready.wait(lock, [this] { return state_->value.has_value() || !state_->sender_alive; });
        return TakeLocked(lock);
    }

    /// Like Receive, but fails with Expired after @p timeout; the receiver
    /// stays usable after a timeout.
    Result<T, CustodyFailure> Receive(std::chrono::milliseconds timeout) {
        if (!state_) {
            return Result<T, CustodyFailure>::Err(
                CustodyFailure::ChannelClosed(std::string(ErrorMessages::CHANNEL_RECEIVER_USED)));
        }
        std::unique_lock lock(state_->mutex);
        const bool done = state_->ready.wait_for(
            lock, timeout, [this] { return state_->value.has_value() || !state_->sender_alive; });
        if (!done) {
            return Result<T, CustodyFailure>::Err(
                CustodyFailure::Expired("Timed out waiting on one-shot channel"));
        }
        return TakeLocked(lock);
    }

    [[nodiscard]] bool IsUsed() const noexcept { return state_ == nullptr; }

private:
    explicit OneShotReceiver(std::shared_ptr<detail::OneShotState<T>> state) noexcept
        : state_(std::move(state)) {
    }

    Result<T, CustodyFailure> TakeLocked(std::unique_lock<std::mutex>& lock) {
        auto state = std::move(state_);
        state->receiver_alive = false;
        if (!state->value.has_value()) {
            lock.unlock();
            return Result<T, CustodyFailure>::Err(
                CustodyFailure::ChannelClosed(std::string(ErrorMessages::CHANNEL_CLOSED)));
        }
        T value = std::move(*state->value);
        state->value.reset();
        lock.unlock();
        return Result<T, CustodyFailure>::Ok(std::move(value));
    }

    void Close() noexcept {
        if (!state_) {
            return;
        }
        {
            std::lock_guard lock(state_->mutex);
            state_->receiver_alive = false;
            state_->value.reset();
        }
        state_.reset();
    }

    friend std::pair<OneShotSender<T>, OneShotReceiver<T>> MakeOneShotChannel<T>();

    std::shared_ptr<detail::OneShotState<T>> state_;
};

template<typename T>
std::pair<OneShotSender<T>, OneShotReceiver<T>> MakeOneShotChannel() {
    auto state = std::make_shared<detail::OneShotState<T>>();
    return {OneShotSender<T>(state), OneShotReceiver<T>(std::move(state))};
}

}

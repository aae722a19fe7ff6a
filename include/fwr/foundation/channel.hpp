#pragma once

/// @file channel.hpp
/// @brief Unbuffered, closable channel connecting a producer thread to a consumer.
///
/// send() is a rendezvous: the producer blocks until a consumer has taken the
/// value, so a slow consumer stalls the producer instead of losing values.
/// post() is the exception used for re-queueing: it returns immediately and
/// the value is delivered ahead of anything still waiting in send().

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace fwr::foundation {

/// Example:
/// @code
///   Channel<int> ch;
///   std::thread producer([&] { ch.send(42); });
///   auto v = ch.receive();   // 42, producer unblocks
///   producer.join();
///   ch.close();              // later receives return std::nullopt
/// @endcode
template <typename T>
class Channel {
public:
    Channel() = default;
    ~Channel() { close(); }

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;
    Channel(Channel&&) = delete;
    Channel& operator=(Channel&&) = delete;

    /// Hand @p value to a receiver, blocking until it has been taken.
    /// @return false if the channel is (or becomes) closed first.
    bool send(T value) {
        std::unique_lock lock(mutex_);
        if (closed_) {
            return false;
        }
        auto ticket = ++sent_;
        queue_.push_back(std::move(value));
        cv_.notify_all();
        cv_.wait(lock, [&] { return taken_ >= ticket || closed_; });
        return taken_ >= ticket;
    }

    /// Enqueue @p value without waiting for a receiver.
    /// @return false if the channel is closed.
    bool post(T value) {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return false;
        }
        posted_.push_back(std::move(value));
        cv_.notify_all();
        return true;
    }

    /// Block until a value arrives or the channel is closed.
    std::optional<T> receive() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [&] { return readyLocked(); });
        return takeLocked();
    }

    /// Block until a value arrives, the channel is closed, or @p stopToken
    /// is triggered.
    std::optional<T> receive(std::stop_token stopToken) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait(lock, stopToken, [&] { return readyLocked(); })) {
            return std::nullopt;
        }
        return takeLocked();
    }

    /// Like receive(), giving up after @p timeout.
    template <typename Rep, typename Period>
    std::optional<T> receiveFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [&] { return readyLocked(); })) {
            return std::nullopt;
        }
        return takeLocked();
    }

    /// Close the channel: pending values are dropped, blocked senders return
    /// false and blocked receivers return std::nullopt. Idempotent.
    void close() {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        queue_.clear();
        posted_.clear();
        cv_.notify_all();
    }

    [[nodiscard]] bool isClosed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

private:
    bool readyLocked() const {
        return closed_ || !posted_.empty() || !queue_.empty();
    }

    std::optional<T> takeLocked() {
        if (!posted_.empty()) {
            std::optional<T> value(std::move(posted_.front()));
            posted_.pop_front();
            return value;
        }
        if (!queue_.empty()) {
            std::optional<T> value(std::move(queue_.front()));
            queue_.pop_front();
            ++taken_;
            cv_.notify_all();
            return value;
        }
        return std::nullopt;
    }

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<T> queue_;
    std::deque<T> posted_;
    uint64_t sent_ = 0;
    uint64_t taken_ = 0;
    bool closed_ = false;
};

} // namespace fwr::foundation

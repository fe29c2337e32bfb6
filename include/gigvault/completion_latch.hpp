#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>

namespace gigvault {

/// Single-fire completion latch.
///
/// Bridges callback-style completion onto a blocking wait. The first fire()
/// wins: it stores the value, invokes the armed callback (outside the lock)
/// and wakes waiters. Every later fire() is a no-op that returns false, so
/// racing terminal events (success vs. cancel vs. error) deliver exactly once.
template <typename T>
class CompletionLatch {
public:
    using Callback = std::function<void(const T&)>;

    CompletionLatch() = default;
    CompletionLatch(const CompletionLatch&) = delete;
    CompletionLatch& operator=(const CompletionLatch&) = delete;

    /// Install the callback invoked by the winning fire().
    void arm(Callback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        callback_ = std::move(callback);
    }

    /// @return true if this call delivered the result.
    bool fire(T value) {
        Callback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (claimed_) return false;
            claimed_ = true;
            value_ = std::move(value);
            callback = std::move(callback_);
            callback_ = nullptr;
        }

        if (callback) {
            callback(*value_);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            delivered_ = true;
        }
        cv_.notify_all();
        return true;
    }

    bool fired() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return claimed_;
    }

    /// Block until the winning fire() has run its callback.
    T wait() const {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return delivered_; });
        return *value_;
    }

    template <typename Rep, typename Period>
    std::optional<T> wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return delivered_; })) {
            return std::nullopt;
        }
        return *value_;
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    Callback callback_;
    std::optional<T> value_;
    bool claimed_ = false;
    bool delivered_ = false;
};

}  // namespace gigvault

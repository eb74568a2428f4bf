#pragma once
/// @file ReentrantLock.hpp
/// @brief Reentrant exclusive lock with an observable owner and depth

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <system_error>
#include <thread>

namespace JSave {
namespace detail {

/// @brief Exclusive lock that its owning thread may acquire repeatedly
///
/// Meets the TimedLockable requirements, so std::unique_lock works with it.
/// Each successful acquisition by the owner increments the depth; each
/// unlock() decrements it, and the lock is handed to waiting threads only
/// when the depth returns to zero.
class ReentrantLock {
  public:
    ReentrantLock() = default;

    ReentrantLock(const ReentrantLock&) = delete;
    ReentrantLock& operator=(const ReentrantLock&) = delete;

    void lock() {
        const auto self = std::this_thread::get_id();
        std::unique_lock<std::mutex> lk(mtx_);
        if (owner_ == self) {
            ++depth_;
            return;
        }
        released_.wait(lk, [this] { return depth_ == 0; });
        owner_ = self;
        depth_ = 1;
    }

    bool try_lock() {
        const auto self = std::this_thread::get_id();
        std::lock_guard<std::mutex> lk(mtx_);
        if (depth_ == 0) {
            owner_ = self;
            depth_ = 1;
            return true;
        }
        if (owner_ == self) {
            ++depth_;
            return true;
        }
        return false;
    }

    template <typename Rep, typename Period>
    bool try_lock_for(const std::chrono::duration<Rep, Period>& timeout) {
        return try_lock_until(std::chrono::steady_clock::now() + timeout);
    }

    template <typename Clock, typename Duration>
    bool try_lock_until(const std::chrono::time_point<Clock, Duration>& deadline) {
        const auto self = std::this_thread::get_id();
        std::unique_lock<std::mutex> lk(mtx_);
        if (owner_ == self && depth_ > 0) {
            ++depth_;
            return true;
        }
        if (!released_.wait_until(lk, deadline, [this] { return depth_ == 0; }))
            return false;
        owner_ = self;
        depth_ = 1;
        return true;
    }

    /// @throws std::system_error (operation_not_permitted) if the calling
    ///         thread does not hold the lock
    void unlock() {
        std::unique_lock<std::mutex> lk(mtx_);
        if (depth_ == 0 || owner_ != std::this_thread::get_id())
            throw std::system_error(std::make_error_code(std::errc::operation_not_permitted),
                                    "ReentrantLock::unlock by non-owner");

        if (--depth_ == 0) {
            owner_ = std::thread::id();
            lk.unlock();
            released_.notify_one();
        }
    }

    bool isLocked() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return depth_ > 0;
    }

    bool isOwnedByCurrentThread() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return depth_ > 0 && owner_ == std::this_thread::get_id();
    }

    /// @brief Current depth of the calling thread's hold, 0 if it does not own the lock
    size_t depth() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return owner_ == std::this_thread::get_id() ? depth_ : 0;
    }

  private:
    mutable std::mutex mtx_;
    std::condition_variable released_;
    std::thread::id owner_;
    size_t depth_ = 0;
};

} // namespace detail
} // namespace JSave

#pragma once
/// @file Guard.hpp
/// @brief Scoped access handles returned by store acquisitions

#include "ReentrantLock.hpp"

#include <mutex>
#include <shared_mutex>
#include <utility>

namespace JSave {

/// @brief Grants access to a stored value while holding the store's lock
/// @tparam Value T for write guards, const T for read guards
/// @tparam Lock Standard lock object owning the acquisition
///
/// Released exactly once: by unlock() or by the destructor, whichever comes
/// first, on every exit path. A released guard gives no access and never
/// re-acquires; the value must not be touched through it. Releasing a guard
/// never writes the backing file.
///
/// Guards are neither copyable nor movable, so a hold stays on the thread that
/// acquired it. Stores hand them out by guaranteed copy elision (or inside a
/// std::optional built in place). unlock() must be called by that same thread.
template <typename Value, typename Lock> class BasicGuard {
  public:
    using value_type = Value;
    using lock_type = Lock;

    /// @param lock Lock that already owns the store's primitive
    /// @param value Value protected by that primitive
    BasicGuard(Lock lock, Value& value) noexcept : lock_(std::move(lock)), value_(&value) {}

    ~BasicGuard() = default;

    BasicGuard(const BasicGuard&) = delete;
    BasicGuard& operator=(const BasicGuard&) = delete;
    BasicGuard(BasicGuard&&) = delete;
    BasicGuard& operator=(BasicGuard&&) = delete;

    Value& operator*() const noexcept { return *value_; }
    Value* operator->() const noexcept { return value_; }
    Value& get() const noexcept { return *value_; }

    bool ownsLock() const noexcept { return lock_.owns_lock(); }
    explicit operator bool() const noexcept { return ownsLock(); }

    /// @brief Releases the hold before the end of scope
    void unlock() {
        value_ = nullptr;
        if (lock_.owns_lock())
            lock_.unlock();
    }

  private:
    Lock lock_;
    Value* value_ = nullptr;
};

/// @brief Write access to a Mutex store
template <typename T> using MutexGuard = BasicGuard<T, std::unique_lock<std::timed_mutex>>;

/// @brief Shared read access to an RwLock store
template <typename T>
using RwLockReadGuard = BasicGuard<const T, std::shared_lock<std::shared_timed_mutex>>;

/// @brief Exclusive write access to an RwLock store
template <typename T>
using RwLockWriteGuard = BasicGuard<T, std::unique_lock<std::shared_timed_mutex>>;

/// @brief Write access to a ReentrantMutex store; nested guards of the owning
///        thread alias the same value
template <typename T>
using ReentrantMutexGuard = BasicGuard<T, std::unique_lock<detail::ReentrantLock>>;

} // namespace JSave

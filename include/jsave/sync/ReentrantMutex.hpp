#pragma once
/// @file ReentrantMutex.hpp
/// @brief File-backed value behind a reentrant exclusive lock

#include "../Options.hpp"
#include "../codec/JsonCodec.hpp"
#include "AutoSaveGuard.hpp"
#include "Guard.hpp"
#include "ReentrantLock.hpp"
#include "StoreCore.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <system_error>
#include <utility>

namespace JSave {

/// @brief Value of type T behind a lock its owner may take again, persisted to one file
/// @tparam T Stored value type
/// @tparam Codec Encoding policy (JsonCodec by default)
///
/// The owning thread may call lock(), save() and every try* form while it
/// already holds a guard; they succeed immediately and nest. Nested guards
/// refer to the same value. The lock passes to another thread only after the
/// outermost guard is released.
template <typename T, typename Codec = JsonCodec<>> class ReentrantMutex {
  public:
    using value_type = T;
    using Guard = ReentrantMutexGuard<T>;
    using SavingGuard = AutoSaveGuard<ReentrantMutex, Guard>;

    /// @brief Loads the store from an existing backing file. Writes nothing.
    /// @return The store, or nullptr with @p ec set (I/O or decode error)
    static std::unique_ptr<ReentrantMutex> init(const std::string& path, std::error_code& ec,
                                                Options options = Options()) {
        return Core::template createFromFile<ReentrantMutex>(path, std::move(options), ec);
    }

    /// @brief Creates the store and immediately writes @p initial to @p path
    static std::unique_ptr<ReentrantMutex> initWith(T initial, const std::string& path,
                                                    std::error_code& ec,
                                                    Options options = Options()) {
        return Core::template createWith<ReentrantMutex>(std::move(initial), path,
                                                         std::move(options), ec);
    }

    static T intoInner(std::unique_ptr<ReentrantMutex> store) { return store->core_.take(); }

    ReentrantMutex(const ReentrantMutex&) = delete;
    ReentrantMutex& operator=(const ReentrantMutex&) = delete;

    /// @brief Blocks until the calling thread owns the lock (immediately if it already does)
    Guard lock() {
        return Guard(std::unique_lock<detail::ReentrantLock>(lock_), core_.value());
    }

    std::optional<Guard> tryLock() {
        std::unique_lock<detail::ReentrantLock> lk(lock_, std::try_to_lock);
        if (!lk.owns_lock())
            return std::nullopt;
        return std::optional<Guard>(std::in_place, std::move(lk), core_.value());
    }

    template <typename Rep, typename Period>
    std::optional<Guard> tryLockFor(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<detail::ReentrantLock> lk(lock_, timeout);
        if (!lk.owns_lock())
            return std::nullopt;
        return std::optional<Guard>(std::in_place, std::move(lk), core_.value());
    }

    template <typename Clock, typename Duration>
    std::optional<Guard> tryLockUntil(const std::chrono::time_point<Clock, Duration>& deadline) {
        std::unique_lock<detail::ReentrantLock> lk(lock_, deadline);
        if (!lk.owns_lock())
            return std::nullopt;
        return std::optional<Guard>(std::in_place, std::move(lk), core_.value());
    }

    SavingGuard lockAndSave(SaveErrorHandler onError = SaveErrorHandler()) {
        return SavingGuard(*this, std::unique_lock<detail::ReentrantLock>(lock_), core_.value(),
                           std::move(onError));
    }

    /// @brief Writes the current value to the backing file
    ///
    /// Callable while the calling thread holds guards; the value is then saved
    /// as those guards currently see it.
    bool save(std::error_code& ec) {
        std::unique_lock<detail::ReentrantLock> lk(lock_);
        return core_.save(ec);
    }

    bool trySave(std::error_code& ec) {
        std::unique_lock<detail::ReentrantLock> lk(lock_, std::try_to_lock);
        if (!lk.owns_lock()) {
            ec = std::make_error_code(std::errc::resource_unavailable_try_again);
            return false;
        }
        return core_.save(ec);
    }

    template <typename Rep, typename Period>
    bool trySaveFor(const std::chrono::duration<Rep, Period>& timeout, std::error_code& ec) {
        std::unique_lock<detail::ReentrantLock> lk(lock_, timeout);
        if (!lk.owns_lock()) {
            ec = std::make_error_code(std::errc::timed_out);
            return false;
        }
        return core_.save(ec);
    }

    template <typename Clock, typename Duration>
    bool trySaveUntil(const std::chrono::time_point<Clock, Duration>& deadline,
                      std::error_code& ec) {
        std::unique_lock<detail::ReentrantLock> lk(lock_, deadline);
        if (!lk.owns_lock()) {
            ec = std::make_error_code(std::errc::timed_out);
            return false;
        }
        return core_.save(ec);
    }

    bool isLocked() const { return lock_.isLocked(); }
    bool isOwnedByCurrentThread() const { return lock_.isOwnedByCurrentThread(); }

    /// @brief Number of guards the calling thread currently holds (0 if not the owner)
    size_t recursionDepth() const { return lock_.depth(); }

    T& getMut() noexcept { return core_.value(); }

    const std::string& path() const noexcept { return core_.path(); }
    const Options& options() const noexcept { return core_.options(); }

    void print(std::ostream& os) const {
        std::unique_lock<detail::ReentrantLock> lk(lock_, std::try_to_lock);
        core_.print(os, "ReentrantMutex", lk.owns_lock() ? &core_.value() : nullptr);
    }

  private:
    using Core = detail::StoreCore<T, Codec>;
    friend Core;

    explicit ReentrantMutex(Core&& core) : core_(std::move(core)) {}

    Core core_;
    mutable detail::ReentrantLock lock_;
};

template <typename T, typename Codec>
std::ostream& operator<<(std::ostream& os, const ReentrantMutex<T, Codec>& store) {
    store.print(os);
    return os;
}

} // namespace JSave

#pragma once
/// @file Mutex.hpp
/// @brief File-backed value behind an exclusive lock

#include "../Options.hpp"
#include "../codec/JsonCodec.hpp"
#include "AutoSaveGuard.hpp"
#include "Guard.hpp"
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

/// @brief Value of type T guarded by an exclusive lock and persisted to one file
/// @tparam T Stored value type
/// @tparam Codec Encoding policy (JsonCodec by default)
///
/// Instances are created by init() or initWith() and are neither copyable nor
/// movable. A thread holding a MutexGuard must not call lock(), tryLock*,
/// save(), trySave*, isLocked() or print() on the same store.
template <typename T, typename Codec = JsonCodec<>> class Mutex {
  public:
    using value_type = T;
    using Guard = MutexGuard<T>;
    using SavingGuard = AutoSaveGuard<Mutex, Guard>;

    /// @brief Loads the store from an existing backing file. Writes nothing.
    /// @param path Backing file
    /// @param ec I/O error, or Errc::DecodeFailed when the contents do not decode as T
    /// @param options Encoding and write settings used for later saves
    /// @return The store, or nullptr on failure
    static std::unique_ptr<Mutex> init(const std::string& path, std::error_code& ec,
                                       Options options = Options()) {
        return Core::template createFromFile<Mutex>(path, std::move(options), ec);
    }

    /// @brief Creates the store and immediately writes @p initial to @p path
    ///        (created or truncated)
    /// @return The store, or nullptr if encoding or writing failed
    static std::unique_ptr<Mutex> initWith(T initial, const std::string& path,
                                           std::error_code& ec, Options options = Options()) {
        return Core::template createWith<Mutex>(std::move(initial), path, std::move(options), ec);
    }

    /// @brief Consumes the store and returns its value
    static T intoInner(std::unique_ptr<Mutex> store) { return store->core_.take(); }

    Mutex(const Mutex&) = delete;
    Mutex& operator=(const Mutex&) = delete;

    /// @brief Blocks until exclusive access is granted
    Guard lock() { return Guard(std::unique_lock<std::timed_mutex>(mtx_), core_.value()); }

    std::optional<Guard> tryLock() {
        std::unique_lock<std::timed_mutex> lk(mtx_, std::try_to_lock);
        if (!lk.owns_lock())
            return std::nullopt;
        return std::optional<Guard>(std::in_place, std::move(lk), core_.value());
    }

    template <typename Rep, typename Period>
    std::optional<Guard> tryLockFor(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::timed_mutex> lk(mtx_, timeout);
        if (!lk.owns_lock())
            return std::nullopt;
        return std::optional<Guard>(std::in_place, std::move(lk), core_.value());
    }

    template <typename Clock, typename Duration>
    std::optional<Guard> tryLockUntil(const std::chrono::time_point<Clock, Duration>& deadline) {
        std::unique_lock<std::timed_mutex> lk(mtx_, deadline);
        if (!lk.owns_lock())
            return std::nullopt;
        return std::optional<Guard>(std::in_place, std::move(lk), core_.value());
    }

    /// @brief Locks and returns a guard that saves the store when released
    SavingGuard lockAndSave(SaveErrorHandler onError = SaveErrorHandler()) {
        return SavingGuard(*this, std::unique_lock<std::timed_mutex>(mtx_), core_.value(),
                           std::move(onError));
    }

    /// @brief Writes the current value to the backing file
    ///
    /// The lock is held from before the encode until the write completes.
    /// On failure the in-memory value is untouched and save() may be retried.
    bool save(std::error_code& ec) {
        std::unique_lock<std::timed_mutex> lk(mtx_);
        return core_.save(ec);
    }

    /// @brief save() if the lock is free right now
    /// @param ec resource_unavailable_try_again when the lock is held elsewhere
    bool trySave(std::error_code& ec) {
        std::unique_lock<std::timed_mutex> lk(mtx_, std::try_to_lock);
        if (!lk.owns_lock()) {
            ec = std::make_error_code(std::errc::resource_unavailable_try_again);
            return false;
        }
        return core_.save(ec);
    }

    template <typename Rep, typename Period>
    bool trySaveFor(const std::chrono::duration<Rep, Period>& timeout, std::error_code& ec) {
        std::unique_lock<std::timed_mutex> lk(mtx_, timeout);
        if (!lk.owns_lock()) {
            ec = std::make_error_code(std::errc::timed_out);
            return false;
        }
        return core_.save(ec);
    }

    template <typename Clock, typename Duration>
    bool trySaveUntil(const std::chrono::time_point<Clock, Duration>& deadline,
                      std::error_code& ec) {
        std::unique_lock<std::timed_mutex> lk(mtx_, deadline);
        if (!lk.owns_lock()) {
            ec = std::make_error_code(std::errc::timed_out);
            return false;
        }
        return core_.save(ec);
    }

    /// @brief Snapshot: whether some thread holds the lock
    bool isLocked() const {
        if (!mtx_.try_lock())
            return true;
        mtx_.unlock();
        return false;
    }

    /// @brief Unsynchronized access while the caller is the only user of the store
    T& getMut() noexcept { return core_.value(); }

    const std::string& path() const noexcept { return core_.path(); }
    const Options& options() const noexcept { return core_.options(); }

    void print(std::ostream& os) const {
        std::unique_lock<std::timed_mutex> lk(mtx_, std::try_to_lock);
        core_.print(os, "Mutex", lk.owns_lock() ? &core_.value() : nullptr);
    }

  private:
    using Core = detail::StoreCore<T, Codec>;
    friend Core;

    explicit Mutex(Core&& core) : core_(std::move(core)) {}

    Core core_;
    mutable std::timed_mutex mtx_;
};

template <typename T, typename Codec>
std::ostream& operator<<(std::ostream& os, const Mutex<T, Codec>& store) {
    store.print(os);
    return os;
}

} // namespace JSave

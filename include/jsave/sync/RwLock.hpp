#pragma once
/// @file RwLock.hpp
/// @brief File-backed value behind a reader-writer lock

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
#include <shared_mutex>
#include <string>
#include <system_error>
#include <utility>

namespace JSave {

/// @brief Value of type T shared by many readers or one writer, persisted to one file
/// @tparam T Stored value type
/// @tparam Codec Encoding policy (JsonCodec by default)
///
/// save() only reads the value but takes the write side of the lock, so no
/// writer can interleave with the encode. A thread holding any guard of this
/// store must not call write(), read(), the try* forms, save(), isLocked()
/// or print() on it.
template <typename T, typename Codec = JsonCodec<>> class RwLock {
  public:
    using value_type = T;
    using ReadGuard = RwLockReadGuard<T>;
    using WriteGuard = RwLockWriteGuard<T>;
    using SavingGuard = AutoSaveGuard<RwLock, WriteGuard>;

    /// @brief Loads the store from an existing backing file. Writes nothing.
    /// @return The store, or nullptr with @p ec set (I/O or decode error)
    static std::unique_ptr<RwLock> init(const std::string& path, std::error_code& ec,
                                        Options options = Options()) {
        return Core::template createFromFile<RwLock>(path, std::move(options), ec);
    }

    /// @brief Creates the store and immediately writes @p initial to @p path
    static std::unique_ptr<RwLock> initWith(T initial, const std::string& path,
                                            std::error_code& ec, Options options = Options()) {
        return Core::template createWith<RwLock>(std::move(initial), path, std::move(options), ec);
    }

    static T intoInner(std::unique_ptr<RwLock> store) { return store->core_.take(); }

    RwLock(const RwLock&) = delete;
    RwLock& operator=(const RwLock&) = delete;

    // -------------------------------------------------------------------------
    // Shared access
    // -------------------------------------------------------------------------

    /// @brief Blocks until shared access is granted
    ReadGuard read() const {
        return ReadGuard(std::shared_lock<std::shared_timed_mutex>(mtx_), core_.value());
    }

    std::optional<ReadGuard> tryRead() const {
        std::shared_lock<std::shared_timed_mutex> lk(mtx_, std::try_to_lock);
        if (!lk.owns_lock())
            return std::nullopt;
        return std::optional<ReadGuard>(std::in_place, std::move(lk), core_.value());
    }

    template <typename Rep, typename Period>
    std::optional<ReadGuard> tryReadFor(const std::chrono::duration<Rep, Period>& timeout) const {
        std::shared_lock<std::shared_timed_mutex> lk(mtx_, timeout);
        if (!lk.owns_lock())
            return std::nullopt;
        return std::optional<ReadGuard>(std::in_place, std::move(lk), core_.value());
    }

    template <typename Clock, typename Duration>
    std::optional<ReadGuard>
    tryReadUntil(const std::chrono::time_point<Clock, Duration>& deadline) const {
        std::shared_lock<std::shared_timed_mutex> lk(mtx_, deadline);
        if (!lk.owns_lock())
            return std::nullopt;
        return std::optional<ReadGuard>(std::in_place, std::move(lk), core_.value());
    }

    // -------------------------------------------------------------------------
    // Exclusive access
    // -------------------------------------------------------------------------

    /// @brief Blocks until exclusive access is granted
    WriteGuard write() {
        return WriteGuard(std::unique_lock<std::shared_timed_mutex>(mtx_), core_.value());
    }

    std::optional<WriteGuard> tryWrite() {
        std::unique_lock<std::shared_timed_mutex> lk(mtx_, std::try_to_lock);
        if (!lk.owns_lock())
            return std::nullopt;
        return std::optional<WriteGuard>(std::in_place, std::move(lk), core_.value());
    }

    template <typename Rep, typename Period>
    std::optional<WriteGuard> tryWriteFor(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::shared_timed_mutex> lk(mtx_, timeout);
        if (!lk.owns_lock())
            return std::nullopt;
        return std::optional<WriteGuard>(std::in_place, std::move(lk), core_.value());
    }

    template <typename Clock, typename Duration>
    std::optional<WriteGuard>
    tryWriteUntil(const std::chrono::time_point<Clock, Duration>& deadline) {
        std::unique_lock<std::shared_timed_mutex> lk(mtx_, deadline);
        if (!lk.owns_lock())
            return std::nullopt;
        return std::optional<WriteGuard>(std::in_place, std::move(lk), core_.value());
    }

    /// @brief Write guard that saves the store when released
    SavingGuard writeAndSave(SaveErrorHandler onError = SaveErrorHandler()) {
        return SavingGuard(*this, std::unique_lock<std::shared_timed_mutex>(mtx_), core_.value(),
                           std::move(onError));
    }

    // -------------------------------------------------------------------------
    // Persistence
    // -------------------------------------------------------------------------

    /// @brief Writes the current value to the backing file under the write lock
    bool save(std::error_code& ec) {
        std::unique_lock<std::shared_timed_mutex> lk(mtx_);
        return core_.save(ec);
    }

    bool trySave(std::error_code& ec) {
        std::unique_lock<std::shared_timed_mutex> lk(mtx_, std::try_to_lock);
        if (!lk.owns_lock()) {
            ec = std::make_error_code(std::errc::resource_unavailable_try_again);
            return false;
        }
        return core_.save(ec);
    }

    template <typename Rep, typename Period>
    bool trySaveFor(const std::chrono::duration<Rep, Period>& timeout, std::error_code& ec) {
        std::unique_lock<std::shared_timed_mutex> lk(mtx_, timeout);
        if (!lk.owns_lock()) {
            ec = std::make_error_code(std::errc::timed_out);
            return false;
        }
        return core_.save(ec);
    }

    template <typename Clock, typename Duration>
    bool trySaveUntil(const std::chrono::time_point<Clock, Duration>& deadline,
                      std::error_code& ec) {
        std::unique_lock<std::shared_timed_mutex> lk(mtx_, deadline);
        if (!lk.owns_lock()) {
            ec = std::make_error_code(std::errc::timed_out);
            return false;
        }
        return core_.save(ec);
    }

    /// @brief Snapshot: whether any reader or writer holds the lock
    bool isLocked() const {
        if (!mtx_.try_lock())
            return true;
        mtx_.unlock();
        return false;
    }

    T& getMut() noexcept { return core_.value(); }

    const std::string& path() const noexcept { return core_.path(); }
    const Options& options() const noexcept { return core_.options(); }

    void print(std::ostream& os) const {
        std::shared_lock<std::shared_timed_mutex> lk(mtx_, std::try_to_lock);
        core_.print(os, "RwLock", lk.owns_lock() ? &core_.value() : nullptr);
    }

  private:
    using Core = detail::StoreCore<T, Codec>;
    friend Core;

    explicit RwLock(Core&& core) : core_(std::move(core)) {}

    Core core_;
    mutable std::shared_timed_mutex mtx_;
};

template <typename T, typename Codec>
std::ostream& operator<<(std::ostream& os, const RwLock<T, Codec>& store) {
    store.print(os);
    return os;
}

} // namespace JSave

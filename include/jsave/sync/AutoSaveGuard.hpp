#pragma once
/// @file AutoSaveGuard.hpp
/// @brief Write guard that persists the store when it is released

#include "../Error.hpp"
#include "../util/Log.hpp"

#include <cstdio>
#include <exception>
#include <functional>
#include <new>
#include <system_error>
#include <utility>

namespace JSave {

/// @brief Receives the error of a save triggered by a guard release
/// @note Invoked from a destructor. An exception it throws is written to
///       stderr and dropped.
using SaveErrorHandler = std::function<void(const std::error_code&)>;

/// @brief Write guard whose release is followed by a save of the store
/// @tparam Store Store type providing save(std::error_code&)
/// @tparam Guard Write guard of that store
///
/// Release order is: unlock the guard, then call Store::save(), which takes
/// the lock again for the encode and write. A mutation made by another
/// thread in between is therefore included in the save.
///
/// commit() is the fallible path and returns the save result to the caller.
/// If the wrapper is destroyed while still armed, the destructor performs the
/// same steps and reports a failure to the error handler (default: logged at
/// Error level). An exception thrown by the save is reported as well:
/// std::bad_alloc as std::errc::not_enough_memory, anything else as
/// Errc::SaveAborted. dismiss() releases without saving.
template <typename Store, typename Guard> class AutoSaveGuard {
  public:
    using lock_type = typename Guard::lock_type;
    using value_type = typename Guard::value_type;

    /// @param store Store saved on release
    /// @param lock Lock that already owns the store's primitive
    /// @param value Value protected by that primitive
    /// @param onError Receives a failure of the destructor's save
    AutoSaveGuard(Store& store, lock_type lock, value_type& value,
                  SaveErrorHandler onError = SaveErrorHandler())
        : store_(&store), guard_(std::move(lock), value), onError_(std::move(onError)) {}

    ~AutoSaveGuard() {
        if (!armed_)
            return;

        std::error_code ec;
        try {
            if (commit(ec))
                return;
        } catch (const std::system_error& e) {
            ec = e.code();
        } catch (const std::bad_alloc&) {
            ec = std::make_error_code(std::errc::not_enough_memory);
        } catch (const std::exception&) {
            ec = Errc::SaveAborted;
        }
        report(ec);
    }

    // Pinned to the acquiring thread like the guard it wraps
    AutoSaveGuard(const AutoSaveGuard&) = delete;
    AutoSaveGuard& operator=(const AutoSaveGuard&) = delete;
    AutoSaveGuard(AutoSaveGuard&&) = delete;
    AutoSaveGuard& operator=(AutoSaveGuard&&) = delete;

    auto& operator*() const noexcept { return *guard_; }
    auto* operator->() const noexcept { return guard_.operator->(); }
    auto& get() const noexcept { return guard_.get(); }

    bool ownsLock() const noexcept { return guard_.ownsLock(); }

    /// @brief True until commit() or dismiss() runs
    bool armed() const noexcept { return armed_; }

    /// @brief Releases the guard and saves the store
    /// @param ec Error of the save
    /// @return true if the save succeeded, or if commit()/dismiss() already ran
    bool commit(std::error_code& ec) {
        ec.clear();
        if (!armed_)
            return true;
        armed_ = false;
        guard_.unlock();
        return store_->save(ec);
    }

    /// @brief Releases the guard without saving
    void dismiss() {
        armed_ = false;
        guard_.unlock();
    }

  private:
    void report(const std::error_code& ec) noexcept {
        try {
            if (onError_) {
                onError_(ec);
                return;
            }
            JSAVE_ERROR("save on guard release failed: " << ec.message());
        } catch (const std::exception& e) {
            // 소멸자 경로라 더 전파할 수 없으므로 할당 없이 stderr 로만 남긴다
            std::fprintf(stderr, "jsave: reporting a failed save threw: %s\n", e.what());
        }
    }

    Store* store_;
    Guard guard_;
    SaveErrorHandler onError_;
    bool armed_ = true;
};

} // namespace JSave

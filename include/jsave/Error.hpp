#pragma once
/// @file Error.hpp
/// @brief Error codes reported by stores and their classification
///
/// Stores report failures through std::error_code:
/// - I/O: errno of the failing syscall (generic category)
/// - decode / encode: JSave::Errc (jsave category)
/// - lock not obtained by trySave*: resource_unavailable_try_again / timed_out

#include <string>
#include <system_error>
#include <type_traits>

namespace JSave {

/// @brief Failures that do not come from a syscall
enum class Errc {
    DecodeFailed = 1, ///< backing file is not JSON or does not convert to the value type
    EncodeFailed,     ///< value could not be converted to JSON
    InvalidUtf8,      ///< a string holds invalid UTF-8 under Utf8Policy::Strict
    SaveAborted       ///< save on guard release ended with an exception
};

namespace detail {

class ErrorCategory : public std::error_category {
  public:
    const char* name() const noexcept override { return "jsave"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
        case Errc::DecodeFailed:
            return "backing file does not decode as the stored type";
        case Errc::EncodeFailed:
            return "value cannot be encoded";
        case Errc::InvalidUtf8:
            return "string is not valid UTF-8";
        case Errc::SaveAborted:
            return "save aborted by an exception";
        }
        return "unknown jsave error";
    }
};

} // namespace detail

inline const std::error_category& errorCategory() noexcept {
    static const detail::ErrorCategory category;
    return category;
}

inline std::error_code make_error_code(Errc e) noexcept {
    return std::error_code(static_cast<int>(e), errorCategory());
}

/// @brief Backing file contents were not a valid encoding of the value type
inline bool isDecodeError(const std::error_code& ec) noexcept {
    return ec.category() == errorCategory() && ec.value() == static_cast<int>(Errc::DecodeFailed);
}

/// @brief The value could not be encoded
inline bool isEncodeError(const std::error_code& ec) noexcept {
    return ec.category() == errorCategory() &&
           (ec.value() == static_cast<int>(Errc::EncodeFailed) ||
            ec.value() == static_cast<int>(Errc::InvalidUtf8));
}

/// @brief A trySave* call gave up before obtaining the lock
inline bool isLockUnavailable(const std::error_code& ec) noexcept {
    return ec == std::errc::resource_unavailable_try_again || ec == std::errc::timed_out;
}

/// @brief A failed open/read/write/fsync/rename/close
inline bool isIoError(const std::error_code& ec) noexcept {
    return ec && ec.category() != errorCategory() && !isLockUnavailable(ec);
}

} // namespace JSave

namespace std {
template <> struct is_error_code_enum<JSave::Errc> : true_type {};
} // namespace std

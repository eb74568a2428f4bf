#pragma once
/// @file UniqueFd.hpp
/// @brief RAII owner of a POSIX file descriptor used for backing file I/O

#include <errno.h>
#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

#include <string>
#include <system_error>

namespace JSave {
namespace detail {

/// @brief Owns one file descriptor and closes it on destruction
///
/// Backing files are opened through open(), which retries on EINTR and
/// always adds O_CLOEXEC. Writers should finish with close(ec) so that
/// errors reported by ::close() reach the caller instead of being dropped
/// in the destructor.
///
/// @note This class is for internal library use.
class UniqueFd {
  public:
    UniqueFd() noexcept = default;

    /// @brief Takes ownership of @p fd
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}

    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other)
            reset(other.release());
        return *this;
    }

    /// @brief Opens @p path
    /// @param path File to open
    /// @param flags open(2) flags; O_CLOEXEC is added
    /// @param mode Permission bits used when O_CREAT creates the file
    /// @param ec errno of the failed open(2)
    /// @return Owning handle, invalid on failure
    static UniqueFd open(const std::string& path, int flags, mode_t mode, std::error_code& ec) {
        ec.clear();
#ifdef O_CLOEXEC
        flags |= O_CLOEXEC;
#endif
        int fd = -1;
        do {
            fd = ::open(path.c_str(), flags, mode);
        } while (fd < 0 && errno == EINTR);

        if (fd < 0) {
            ec = std::error_code(errno, std::generic_category());
            return UniqueFd();
        }
        return UniqueFd(fd);
    }

    int get() const noexcept { return fd_; }

    bool valid() const noexcept { return fd_ >= 0; }

    explicit operator bool() const noexcept { return valid(); }

    /// @brief Gives up ownership without closing
    int release() noexcept {
        int tmp = fd_;
        fd_ = -1;
        return tmp;
    }

    /// @brief Closes the owned fd (errors ignored) and adopts @p newFd
    void reset(int newFd = -1) noexcept {
        if (fd_ >= 0)
            ::close(fd_);
        fd_ = newFd;
    }

    /// @brief Closes the owned fd and reports the result
    /// @return true if nothing was open or ::close() succeeded
    bool close(std::error_code& ec) noexcept {
        ec.clear();
        if (fd_ < 0)
            return true;
        // close() 실패 후 같은 fd 를 다시 닫으면 안 되므로 먼저 소유권을 놓는다.
        int fd = release();
        if (::close(fd) != 0) {
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
        return true;
    }

  private:
    int fd_ = -1;
};

} // namespace detail
} // namespace JSave

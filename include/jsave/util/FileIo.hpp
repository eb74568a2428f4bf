#pragma once
/// @file FileIo.hpp
/// @brief Whole-file read and write helpers for the backing file

#include "Log.hpp"
#include "UniqueFd.hpp"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <filesystem>
#include <string>
#include <system_error>

namespace JSave::util {

inline std::error_code errnoCode(int err = errno) {
    return std::error_code(err, std::generic_category());
}

/// @brief Reads the entire file at @p path into @p out
/// @param path File to read
/// @param out Replaced with the file contents (cleared on failure)
/// @param ec errno-based error on failure
/// @return true on success
inline bool readFile(const std::string& path, std::string& out, std::error_code& ec) {
    out.clear();
    detail::UniqueFd fd = detail::UniqueFd::open(path, O_RDONLY, 0, ec);
    if (ec)
        return false;

    struct stat st{};
    if (::fstat(fd.get(), &st) < 0) {
        ec = errnoCode();
        return false;
    }
    if (st.st_size > 0)
        out.reserve(static_cast<size_t>(st.st_size));

    char buffer[4096];
    while (true) {
        ssize_t n = ::read(fd.get(), buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR)
                continue;
            ec = errnoCode();
            out.clear();
            return false;
        }
        if (n == 0)
            break;
        out.append(buffer, static_cast<size_t>(n));
    }

    return fd.close(ec);
}

/// @brief Writes @p size bytes, resuming after partial writes and EINTR
/// @return true when every byte was written
inline bool writeAll(int fd, const char* data, size_t size, std::error_code& ec) {
    ec.clear();
    while (size > 0) {
        ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            ec = errnoCode();
            return false;
        }
        if (n == 0) {
            ec = std::make_error_code(std::errc::io_error);
            return false;
        }
        data += n;
        size -= static_cast<size_t>(n);
    }
    return true;
}

/// @brief Writes @p contents to an already opened fd, optionally fsyncs, then closes it
inline bool writeAndClose(detail::UniqueFd& fd, const std::string& contents, bool sync,
                          std::error_code& ec) {
    if (!writeAll(fd.get(), contents.data(), contents.size(), ec))
        return false;
    if (sync && ::fsync(fd.get()) != 0) {
        ec = errnoCode();
        return false;
    }
    return fd.close(ec);
}

/// @brief Replaces the contents of @p path in place (O_CREAT | O_TRUNC)
///
/// A failure after the truncate leaves the file short or empty.
///
/// @param path Target file
/// @param contents New contents
/// @param mode Permission bits if the file gets created
/// @param sync fsync before close
/// @param ec errno-based error on failure
inline bool writeFile(const std::string& path, const std::string& contents, mode_t mode,
                      bool sync, std::error_code& ec) {
    detail::UniqueFd fd = detail::UniqueFd::open(path, O_WRONLY | O_CREAT | O_TRUNC, mode, ec);
    if (ec)
        return false;
    return writeAndClose(fd, contents, sync, ec);
}

/// @brief Flushes the directory entry of @p path
inline bool syncParentDirectory(const std::string& path, std::error_code& ec) {
    std::string dir = std::filesystem::path(path).parent_path().string();
    if (dir.empty())
        dir = ".";

    int flags = O_RDONLY;
#ifdef O_DIRECTORY
    flags |= O_DIRECTORY;
#endif
    detail::UniqueFd fd = detail::UniqueFd::open(dir, flags, 0, ec);
    if (ec)
        return false;
    if (::fsync(fd.get()) != 0) {
        ec = errnoCode();
        return false;
    }
    return fd.close(ec);
}

/// @brief Temporary sibling used by replaceFile()
inline std::string tempPathFor(const std::string& path) { return path + ".tmp"; }

/// @brief Replaces @p path by writing a temporary sibling and renaming it over
///
/// Either the old or the new contents are visible at @p path at any time.
/// The temporary file is removed when any step fails.
inline bool replaceFile(const std::string& path, const std::string& contents, mode_t mode,
                        bool sync, std::error_code& ec) {
    const std::string tmp = tempPathFor(path);

    detail::UniqueFd fd = detail::UniqueFd::open(tmp, O_WRONLY | O_CREAT | O_TRUNC, mode, ec);
    if (ec)
        return false;

    // 임시 파일을 만든 이후의 실패 경로에서는 반드시 임시 파일을 지운다.
    auto discardTemp = [&tmp]() {
        if (::unlink(tmp.c_str()) != 0 && errno != ENOENT) {
            int err = errno;
            JSAVE_WARN("could not remove temporary file " << tmp << ": " << ::strerror(err));
        }
    };

    if (!writeAndClose(fd, contents, sync, ec)) {
        discardTemp();
        return false;
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        ec = errnoCode();
        discardTemp();
        return false;
    }

    if (sync)
        return syncParentDirectory(path, ec);
    return true;
}

} // namespace JSave::util

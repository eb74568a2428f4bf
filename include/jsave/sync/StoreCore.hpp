#pragma once
/// @file StoreCore.hpp
/// @brief State and persistence shared by the Mutex, RwLock and ReentrantMutex stores

#include "../Options.hpp"
#include "../util/FileIo.hpp"
#include "../util/Log.hpp"

#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <system_error>
#include <utility>

namespace JSave {
namespace detail {

/// @brief Value, backing path and options of one store
/// @tparam T Stored value type
/// @tparam Codec Encoder/decoder policy (see JsonCodec)
///
/// Holds no lock. Every member that touches the value assumes the owning
/// facade already holds the appropriate access.
template <typename T, typename Codec> class StoreCore {
  public:
    StoreCore(T value, std::string path, Options options)
        : path_(std::move(path)), options_(std::move(options)), value_(std::move(value)) {}

    StoreCore(const StoreCore&) = delete;
    StoreCore& operator=(const StoreCore&) = delete;
    StoreCore(StoreCore&&) = default;
    StoreCore& operator=(StoreCore&&) = delete;

    /// @brief Encodes @p value and writes it to @p path according to @p options
    static bool persist(const T& value, const std::string& path, const Options& options,
                        std::error_code& ec) {
        std::string encoded;
        if (!Codec::encode(value, options, encoded, ec)) {
            JSAVE_WARN("not writing " << path << ": " << ec.message());
            return false;
        }

        bool ok = options.writePolicy == WritePolicy::ReplaceAtomically
                      ? util::replaceFile(path, encoded, options.fileMode, options.syncOnSave, ec)
                      : util::writeFile(path, encoded, options.fileMode, options.syncOnSave, ec);
        if (!ok) {
            JSAVE_WARN("write of " << path << " failed: " << ec.message());
            return false;
        }

        JSAVE_DEBUG("wrote " << encoded.size() << " bytes to " << path);
        return true;
    }

    /// @brief Reads and decodes @p path
    static std::optional<T> load(const std::string& path, const Options& options,
                                 std::error_code& ec) {
        std::string contents;
        if (!util::readFile(path, contents, ec)) {
            JSAVE_WARN("read of " << path << " failed: " << ec.message());
            return std::nullopt;
        }

        auto value = Codec::template decode<T>(contents, options, ec);
        if (!value) {
            JSAVE_WARN(path << " does not hold a valid value: " << ec.message());
            return std::nullopt;
        }
        return value;
    }

    /// @brief Persists @p initial, then builds a Store around it
    ///
    /// Store must be constructible from StoreCore&& (usually through
    /// friendship, its constructor being private).
    template <typename Store>
    static std::unique_ptr<Store> createWith(T initial, const std::string& path, Options options,
                                             std::error_code& ec) {
        ec.clear();
        if (!persist(initial, path, options, ec))
            return nullptr;
        return std::unique_ptr<Store>(
            new Store(StoreCore(std::move(initial), path, std::move(options))));
    }

    /// @brief Loads @p path, then builds a Store around the decoded value
    template <typename Store>
    static std::unique_ptr<Store> createFromFile(const std::string& path, Options options,
                                                 std::error_code& ec) {
        ec.clear();
        auto loaded = load(path, options, ec);
        if (!loaded)
            return nullptr;
        JSAVE_DEBUG("loaded " << path);
        return std::unique_ptr<Store>(
            new Store(StoreCore(std::move(*loaded), path, std::move(options))));
    }

    /// @brief Writes the current value; caller holds exclusive access
    bool save(std::error_code& ec) const {
        ec.clear();
        return persist(value_, path_, options_, ec);
    }

    /// @brief Debug representation; @p value is null when it could not be read
    ///        without blocking
    void print(std::ostream& os, const char* kind, const T* value) const {
        os << kind << " { path: \"" << path_ << "\", value: ";
        if (!value) {
            os << "<locked>";
        } else {
            std::string encoded;
            std::error_code ec;
            if (Codec::encode(*value, Options(), encoded, ec))
                os << encoded;
            else
                os << "<unencodable: " << ec.message() << ">";
        }
        os << " }";
    }

    T& value() noexcept { return value_; }
    const T& value() const noexcept { return value_; }

    /// @brief Moves the value out, leaving the core unusable
    T take() { return std::move(value_); }

    const std::string& path() const noexcept { return path_; }
    const Options& options() const noexcept { return options_; }

  private:
    const std::string path_;
    const Options options_;
    T value_;
};

} // namespace detail
} // namespace JSave

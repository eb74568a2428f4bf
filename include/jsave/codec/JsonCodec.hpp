#pragma once
/// @file JsonCodec.hpp
/// @brief JSON encoding of stored values (nlohmann/json)

#include "../Error.hpp"
#include "../Options.hpp"
#include "../util/Log.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <system_error>

namespace JSave {

/// @brief Encodes and decodes values through nlohmann/json
/// @tparam Json nlohmann::json (object keys sorted) or nlohmann::ordered_json
///         (object keys kept in insertion order)
///
/// The value type must be convertible with the usual to_json/from_json
/// customization points (or NLOHMANN_DEFINE_TYPE_* macros).
///
/// A store accepts any codec type providing the same two static templates.
/// No exception escapes either function; nlohmann errors become error codes.
template <typename Json = nlohmann::json> struct JsonCodec {
    using json_type = Json;

    /// @brief Serializes @p value
    /// @param value Value to encode
    /// @param options indent / ensureAscii / invalidUtf8 are honoured
    /// @param out Encoded text
    /// @param ec Errc::InvalidUtf8 for invalid UTF-8 under Utf8Policy::Strict,
    ///        Errc::EncodeFailed for any other conversion failure
    /// @return true on success
    template <typename T>
    static bool encode(const T& value, const Options& options, std::string& out,
                       std::error_code& ec) {
        ec.clear();
        try {
            Json j = value;
            out = j.dump(options.indent, options.indentChar, options.ensureAscii,
                         errorHandler(options.invalidUtf8));
            return true;
        } catch (const typename Json::type_error& e) {
            JSAVE_WARN("encode failed: " << e.what());
            // 316: dump() 중 잘못된 UTF-8 바이트를 만난 경우
            ec = e.id == 316 ? Errc::InvalidUtf8 : Errc::EncodeFailed;
            return false;
        } catch (const typename Json::exception& e) {
            JSAVE_WARN("encode failed: " << e.what());
            ec = Errc::EncodeFailed;
            return false;
        }
    }

    /// @brief Parses @p text as a T
    /// @param text Whole backing file contents
    /// @param options ignoreComments is honoured
    /// @param ec Errc::DecodeFailed when the text is not JSON or does not convert to T
    /// @return Decoded value, or std::nullopt on failure
    template <typename T>
    static std::optional<T> decode(const std::string& text, const Options& options,
                                   std::error_code& ec) {
        ec.clear();
        Json j = Json::parse(text, nullptr, false, options.ignoreComments);
        if (j.is_discarded()) {
            JSAVE_WARN("decode failed: malformed JSON (" << text.size() << " bytes)");
            ec = Errc::DecodeFailed;
            return std::nullopt;
        }

        try {
            return j.template get<T>();
        } catch (const typename Json::exception& e) {
            JSAVE_WARN("decode failed: " << e.what());
            ec = Errc::DecodeFailed;
            return std::nullopt;
        }
    }

  private:
    static typename Json::error_handler_t errorHandler(Utf8Policy policy) noexcept {
        switch (policy) {
        case Utf8Policy::Replace:
            return Json::error_handler_t::replace;
        case Utf8Policy::Ignore:
            return Json::error_handler_t::ignore;
        case Utf8Policy::Strict:
            break;
        }
        return Json::error_handler_t::strict;
    }
};

/// @brief Codec that preserves object key order
using OrderedJsonCodec = JsonCodec<nlohmann::ordered_json>;

} // namespace JSave

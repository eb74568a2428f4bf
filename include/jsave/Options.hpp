#pragma once
/// @file Options.hpp
/// @brief Encoding and write settings fixed at store construction

#include <sys/types.h>

namespace JSave {

/// @brief How save() replaces the backing file
enum class WritePolicy {
    TruncateInPlace,  ///< open with O_TRUNC and rewrite; a failed write can leave a short file
    ReplaceAtomically ///< write "<path>.tmp" and rename() it over the backing file
};

/// @brief Encode-time handling of strings that are not valid UTF-8
enum class Utf8Policy {
    Strict,  ///< fail the encode with Errc::InvalidUtf8
    Replace, ///< substitute U+FFFD
    Ignore   ///< drop the offending bytes
};

/// @brief Store options
struct Options {
    /// Negative: compact single line. Zero or more: pretty-printed, that many
    /// indentChar per nesting level.
    int indent = -1;
    char indentChar = ' ';
    /// Escape every non-ASCII character as \uXXXX
    bool ensureAscii = false;
    Utf8Policy invalidUtf8 = Utf8Policy::Strict;
    /// Accept // and /* */ comments when decoding
    bool ignoreComments = false;
    /// fsync the backing file (and its directory for ReplaceAtomically) on every write
    bool syncOnSave = false;
    WritePolicy writePolicy = WritePolicy::TruncateInPlace;
    /// Permission bits used when the backing file is created
    mode_t fileMode = 0644;

    /// @brief Human-readable multi-line output
    static Options pretty(int indent = 4) {
        Options o;
        o.indent = indent;
        return o;
    }

    bool isPretty() const noexcept { return indent >= 0; }
};

} // namespace JSave

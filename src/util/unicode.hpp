#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <unicode/unistr.h>

namespace tonsentry::util {

// UTF-8 -> UTF-16 with every ill-formed sequence replaced by U+FFFD.
icu::UnicodeString ToUnicode(std::string_view utf8);
std::string ToUtf8(const icu::UnicodeString& text);

// Lossy UTF-8 repair: ill-formed sequences become U+FFFD.
std::string RepairUtf8(std::string_view bytes);

// NFKC compatibility composition. Folds full-width and other compatibility
// forms (e.g. "ｈｔｔｐｓ" -> "https") so substring checks see plain text.
// Input that ICU cannot normalize is returned repaired but unnormalized.
std::string NormalizeNfkc(std::string_view text);

// Locale-independent full lower-casing.
std::string ToLowerUtf8(std::string_view text);

// Keeps at most |max_code_points| code points; never splits a sequence.
std::string TruncateCodePoints(std::string_view utf8, std::size_t max_code_points,
                               bool* truncated = nullptr);

}  // namespace tonsentry::util

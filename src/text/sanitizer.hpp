#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace tonsentry::text {

// Anti-phishing defang for display:
//   1. NFKC normalization (invalid UTF-8 repaired to U+FFFD first),
//   2. "http:" -> "hxxp:", "https:" -> "hxxps:" (case-sensitive, one pass),
//   3. '.' between two word characters -> "[.]".
// Word characters are ASCII letters and digits, '_', '-', and the Cyrillic
// letters А-я, Ё, ё. Applying Defang to its own output never produces a
// bare "http://" or "https://".
std::string Defang(std::string_view text);

// Removes ANSI escape sequences (CSI and OSC) and every code point that is
// not printable: controls, format characters (bidi overrides, zero-width
// joiners), surrogates, private use, unassigned, line/paragraph separators
// and every space separator except U+0020.
std::string StripNonPrintable(std::string_view text);

// StripNonPrintable + Defang, clamped to |max_code_points| with a trailing
// "..." marker when cut.
std::string SanitizeForDisplay(std::string_view text, std::size_t max_code_points);

bool IsPrintableCodePoint(char32_t cp);
bool IsDefangWordCharacter(char32_t cp);

}  // namespace tonsentry::text

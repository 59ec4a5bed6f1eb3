#include "text/sanitizer.hpp"

#include <cstdint>

#include <unicode/uchar.h>
#include <unicode/unistr.h>

#include "util/unicode.hpp"

namespace tonsentry::text {

namespace {

constexpr char32_t kEscape = 0x1B;
constexpr char32_t kBell = 0x07;

std::string ReplaceAll(std::string_view input, std::string_view from, std::string_view to) {
  std::string out;
  out.reserve(input.size());
  std::size_t pos = 0;
  while (true) {
    const auto hit = input.find(from, pos);
    if (hit == std::string_view::npos) {
      out.append(input.substr(pos));
      return out;
    }
    out.append(input.substr(pos, hit - pos));
    out.append(to);
    pos = hit + from.size();
  }
}

// Returns the index just past an escape sequence starting at |index|, which
// must point at ESC.
std::int32_t SkipEscapeSequence(const icu::UnicodeString& text, std::int32_t index) {
  const std::int32_t length = text.length();
  std::int32_t next = index + 1;
  if (next >= length) {
    return next;
  }
  const char16_t introducer = text.charAt(next);
  if (introducer == u'[') {
    // CSI: parameter bytes 0x30-0x3F, intermediate bytes 0x20-0x2F, then one
    // final byte 0x40-0x7E. A malformed sequence ends at the offending char.
    ++next;
    while (next < length) {
      const char16_t c = text.charAt(next);
      if (c >= 0x20 && c <= 0x3F) {
        ++next;
        continue;
      }
      if (c >= 0x40 && c <= 0x7E) {
        return next + 1;
      }
      return next;
    }
    return next;
  }
  if (introducer == u']') {
    // OSC: terminated by BEL or ESC '\'.
    ++next;
    while (next < length) {
      const char16_t c = text.charAt(next);
      if (c == kBell) {
        return next + 1;
      }
      if (c == kEscape) {
        if (next + 1 < length && text.charAt(next + 1) == u'\\') {
          return next + 2;
        }
        return next;
      }
      ++next;
    }
    return next;
  }
  return next;
}

}  // namespace

bool IsPrintableCodePoint(char32_t cp) {
  if (cp == U' ') {
    return true;
  }
  switch (u_charType(static_cast<UChar32>(cp))) {
    case U_CONTROL_CHAR:
    case U_FORMAT_CHAR:
    case U_SURROGATE:
    case U_PRIVATE_USE_CHAR:
    case U_UNASSIGNED:
    case U_LINE_SEPARATOR:
    case U_PARAGRAPH_SEPARATOR:
    case U_SPACE_SEPARATOR:
      return false;
    default:
      return true;
  }
}

bool IsDefangWordCharacter(char32_t cp) {
  if ((cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z') || (cp >= U'0' && cp <= U'9')) {
    return true;
  }
  if (cp == U'_' || cp == U'-') {
    return true;
  }
  // Cyrillic А..я plus Ё and ё.
  return (cp >= 0x0410 && cp <= 0x044F) || cp == 0x0401 || cp == 0x0451;
}

std::string StripNonPrintable(std::string_view text) {
  const icu::UnicodeString source = util::ToUnicode(text);
  icu::UnicodeString kept;
  std::int32_t index = 0;
  while (index < source.length()) {
    const UChar32 cp = source.char32At(index);
    if (static_cast<char32_t>(cp) == kEscape) {
      index = SkipEscapeSequence(source, index);
      continue;
    }
    index = source.moveIndex32(index, 1);
    if (IsPrintableCodePoint(static_cast<char32_t>(cp))) {
      kept.append(cp);
    }
  }
  return util::ToUtf8(kept);
}

std::string Defang(std::string_view text) {
  if (text.empty()) {
    return {};
  }
  std::string normalized = util::NormalizeNfkc(text);
  normalized = ReplaceAll(normalized, "http:", "hxxp:");
  normalized = ReplaceAll(normalized, "https:", "hxxps:");

  const icu::UnicodeString source = util::ToUnicode(normalized);
  icu::UnicodeString out;
  UChar32 previous = U_SENTINEL;
  std::int32_t index = 0;
  while (index < source.length()) {
    const UChar32 cp = source.char32At(index);
    const std::int32_t next = source.moveIndex32(index, 1);
    if (cp == 0x2E && previous != U_SENTINEL && next < source.length() &&
        IsDefangWordCharacter(static_cast<char32_t>(previous)) &&
        IsDefangWordCharacter(static_cast<char32_t>(source.char32At(next)))) {
      out.append(icu::UnicodeString(u"[.]"));
    } else {
      out.append(cp);
    }
    previous = cp;
    index = next;
  }
  return util::ToUtf8(out);
}

std::string SanitizeForDisplay(std::string_view text, std::size_t max_code_points) {
  const std::string defanged = Defang(StripNonPrintable(text));
  bool truncated = false;
  std::string clamped = util::TruncateCodePoints(defanged, max_code_points, &truncated);
  if (truncated) {
    clamped.append("...");
  }
  return clamped;
}

}  // namespace tonsentry::text

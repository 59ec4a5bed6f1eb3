#include "util/unicode.hpp"

#include <cstdint>
#include <limits>

#include <unicode/locid.h>
#include <unicode/normalizer2.h>
#include <unicode/stringpiece.h>
#include <unicode/utypes.h>

namespace tonsentry::util {

namespace {

constexpr std::size_t kMaxIcuLength =
    static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max());

}  // namespace

icu::UnicodeString ToUnicode(std::string_view utf8) {
  const std::size_t length = utf8.size() < kMaxIcuLength ? utf8.size() : kMaxIcuLength;
  return icu::UnicodeString::fromUTF8(
      icu::StringPiece(utf8.data(), static_cast<std::int32_t>(length)));
}

std::string ToUtf8(const icu::UnicodeString& text) {
  std::string out;
  text.toUTF8String(out);
  return out;
}

std::string RepairUtf8(std::string_view bytes) { return ToUtf8(ToUnicode(bytes)); }

std::string NormalizeNfkc(std::string_view text) {
  const icu::UnicodeString source = ToUnicode(text);
  UErrorCode status = U_ZERO_ERROR;
  const icu::Normalizer2* nfkc = icu::Normalizer2::getNFKCInstance(status);
  if (U_FAILURE(status) || nfkc == nullptr) {
    return ToUtf8(source);
  }
  const icu::UnicodeString normalized = nfkc->normalize(source, status);
  if (U_FAILURE(status)) {
    return ToUtf8(source);
  }
  return ToUtf8(normalized);
}

std::string ToLowerUtf8(std::string_view text) {
  icu::UnicodeString value = ToUnicode(text);
  value.toLower(icu::Locale::getRoot());
  return ToUtf8(value);
}

std::string TruncateCodePoints(std::string_view utf8, std::size_t max_code_points,
                               bool* truncated) {
  const icu::UnicodeString value = ToUnicode(utf8);
  std::int32_t index = 0;
  std::size_t count = 0;
  while (index < value.length() && count < max_code_points) {
    index = value.moveIndex32(index, 1);
    ++count;
  }
  if (truncated) {
    *truncated = index < value.length();
  }
  icu::UnicodeString head;
  value.extractBetween(0, index, head);
  return ToUtf8(head);
}

}  // namespace tonsentry::util

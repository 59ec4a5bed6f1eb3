#include <iostream>
#include <string>

#include "text/sanitizer.hpp"

namespace {

bool ExpectString(const std::string& actual, const std::string& expected, const char* label) {
  if (actual != expected) {
    std::cerr << label << ": got '" << actual << "' expected '" << expected << "'\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  using namespace tonsentry::text;

  // Defang.
  if (!ExpectString(Defang("https://evil.com"), "hxxps://evil[.]com", "https link")) return 1;
  if (!ExpectString(Defang("http://a.b.c"), "hxxp://a[.]b[.]c", "consecutive dots")) return 1;
  if (!ExpectString(Defang("HTTPS://evil.com"), "HTTPS://evil[.]com", "scheme case-sensitive")) {
    return 1;
  }
  if (!ExpectString(Defang("End of sentence. Next"), "End of sentence. Next", "prose dot")) {
    return 1;
  }
  if (!ExpectString(Defang("wait..."), "wait...", "ellipsis")) return 1;
  if (!ExpectString(Defang("my_site-1.io"), "my_site-1[.]io", "underscore and hyphen")) return 1;
  if (!ExpectString(Defang(""), "", "empty")) return 1;
  // "пример.рф"
  if (!ExpectString(Defang("\xD0\xBF\xD1\x80\xD0\xB8\xD0\xBC\xD0\xB5\xD1\x80.\xD1\x80\xD1\x84"),
                    "\xD0\xBF\xD1\x80\xD0\xB8\xD0\xBC\xD0\xB5\xD1\x80[.]\xD1\x80\xD1\x84",
                    "cyrillic domain")) {
    return 1;
  }
  // "ｈｔｔｐｓ：／／ｅｖｉｌ．ｃｏｍ"
  if (!ExpectString(Defang("\xEF\xBD\x88\xEF\xBD\x94\xEF\xBD\x94\xEF\xBD\x90\xEF\xBD\x93"
                           "\xEF\xBC\x9A\xEF\xBC\x8F\xEF\xBC\x8F"
                           "\xEF\xBD\x85\xEF\xBD\x96\xEF\xBD\x89\xEF\xBD\x8C"
                           "\xEF\xBC\x8E"
                           "\xEF\xBD\x83\xEF\xBD\x8F\xEF\xBD\x8D"),
                    "hxxps://evil[.]com", "full-width link")) {
    return 1;
  }
  {
    const std::string once = Defang("go to https://evil.com or http://x.y now");
    if (once.find("http://") != std::string::npos || once.find("https://") != std::string::npos) {
      std::cerr << "defang left a live scheme: " << once << "\n";
      return 1;
    }
    if (!ExpectString(Defang(once), once, "defang idempotent")) return 1;
  }

  // StripNonPrintable.
  if (!ExpectString(StripNonPrintable("a\tb\nc\r"), "abc", "ascii controls")) return 1;
  if (!ExpectString(StripNonPrintable("keep spaces"), "keep spaces", "space kept")) return 1;
  if (!ExpectString(StripNonPrintable("\x1b[31mred\x1b[0m"), "red", "csi sequence")) return 1;
  if (!ExpectString(StripNonPrintable("\x1b]0;title\x07visible"), "visible", "osc sequence")) {
    return 1;
  }
  if (!ExpectString(StripNonPrintable("a\xE2\x80\xAE" "b"), "ab", "bidi override")) return 1;
  if (!ExpectString(StripNonPrintable("fr\xE2\x80\x8B" "ee"), "free", "zero-width space")) {
    return 1;
  }
  if (!ExpectString(StripNonPrintable("x\xC2\xA0y"), "xy", "no-break space")) return 1;
  if (!ExpectString(StripNonPrintable("\xD0\x81\xD0\xB6"), "\xD0\x81\xD0\xB6", "cyrillic kept")) {
    return 1;
  }

  if (!IsPrintableCodePoint(U'A') || IsPrintableCodePoint(0x07) || IsPrintableCodePoint(0x200B)) {
    std::cerr << "printable classification mismatch\n";
    return 1;
  }
  if (!IsDefangWordCharacter(0x0451) || !IsDefangWordCharacter(0x0410) ||
      !IsDefangWordCharacter(U'_') || IsDefangWordCharacter(U'[') ||
      IsDefangWordCharacter(0x00E9)) {
    std::cerr << "word character classification mismatch\n";
    return 1;
  }

  // SanitizeForDisplay.
  if (!ExpectString(SanitizeForDisplay("abcdef", 3), "abc...", "truncated label")) return 1;
  if (!ExpectString(SanitizeForDisplay("evil.com\n", 100), "evil[.]com", "sanitized label")) {
    return 1;
  }

  return 0;
}

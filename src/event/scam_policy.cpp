#include "event/scam_policy.hpp"

#include "text/sanitizer.hpp"
#include "util/unicode.hpp"

namespace tonsentry::event {

std::string ScamMatchKey(std::string_view symbol) {
  return util::ToLowerUtf8(text::StripNonPrintable(util::NormalizeNfkc(symbol)));
}

std::optional<std::string> FindScamPattern(std::string_view symbol,
                                           const std::vector<std::string>& patterns) {
  if (symbol.empty()) {
    return std::nullopt;
  }
  const std::string key = ScamMatchKey(symbol);
  for (const auto& pattern : patterns) {
    if (!pattern.empty() && key.find(pattern) != std::string::npos) {
      return pattern;
    }
  }
  return std::nullopt;
}

}  // namespace tonsentry::event

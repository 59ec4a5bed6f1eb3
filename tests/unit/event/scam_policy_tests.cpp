#include <iostream>
#include <string>
#include <vector>

#include "config/decoder_config.hpp"
#include "event/scam_policy.hpp"

using tonsentry::event::FindScamPattern;
using tonsentry::event::ScamMatchKey;

int main() {
  const auto& patterns = tonsentry::config::DefaultDecoderConfig().scam_symbol_patterns;

  {
    const auto match = FindScamPattern("FREE-GIFT", patterns);
    if (!match || (*match != "gift" && *match != "free")) {
      std::cerr << "FREE-GIFT not flagged\n";
      return 1;
    }
  }
  for (const char* flagged : {"ClaimTON", "vouchers", "SUBSCRIBE", "\xEF\xBC\xA6REE",
                              "fr\xE2\x80\x8B" "ee", "G\xE2\x80\xAEIFT"}) {
    if (!FindScamPattern(flagged, patterns)) {
      std::cerr << "symbol not flagged: " << flagged << "\n";
      return 1;
    }
  }
  for (const char* clean : {"USDT", "NOT", "jUSDC", ""}) {
    if (FindScamPattern(clean, patterns)) {
      std::cerr << "clean symbol flagged: " << clean << "\n";
      return 1;
    }
  }
  if (FindScamPattern("anything", std::vector<std::string>{""})) {
    std::cerr << "empty pattern matched\n";
    return 1;
  }

  if (ScamMatchKey("\xEF\xBC\xA6R\xE2\x80\x8B" "EE") != "free") {
    std::cerr << "match key not canonical: " << ScamMatchKey("\xEF\xBC\xA6R\xE2\x80\x8B" "EE")
              << "\n";
    return 1;
  }

  return 0;
}

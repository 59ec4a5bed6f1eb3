#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace tonsentry::config {

struct DecoderConfig {
  // Encoded comments longer than this are never decoded.
  std::size_t max_encoded_comment_bytes{4096};
  std::string oversized_payload_placeholder{"<encoded payload too large>"};
  // Jetton decimal counts outside [0, max_jetton_decimals] are treated as
  // untrusted and replaced by default_jetton_decimals.
  int max_jetton_decimals{30};
  int default_jetton_decimals{9};
  // Nanotons per TON.
  unsigned native_decimals{9};
  std::string native_currency{"TON"};
  // Lower-case substrings that mark a jetton symbol as a likely scam.
  std::vector<std::string> scam_symbol_patterns{"claim", "gift", "subs", "free", "voucher"};
  // Web gateways that wrap transfer links; rewritten to transfer_prefix.
  std::vector<std::string> mirror_prefixes{
      "https://app.tonkeeper.com/transfer/",
      "https://tonkeeper.com/transfer/",
      "https://tonhub.com/transfer/",
  };
  std::string transfer_prefix{"ton://transfer/"};
  // Attacker-controlled labels (symbols, op codes) are clamped to this many
  // code points before display.
  std::size_t max_display_code_points{256};
};

const DecoderConfig& DefaultDecoderConfig();

// Reads a JSON object whose keys override the defaults. Throws
// std::runtime_error on I/O failure, malformed JSON, unknown keys, wrong value
// types or out-of-range values.
DecoderConfig LoadDecoderConfig(const std::string& path);
DecoderConfig ParseDecoderConfig(const std::string& json_text);

}  // namespace tonsentry::config

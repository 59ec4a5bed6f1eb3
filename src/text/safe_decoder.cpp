#include "text/safe_decoder.hpp"

#include <cstdint>
#include <exception>
#include <vector>

#include "text/sanitizer.hpp"
#include "util/base64.hpp"
#include "util/logging.hpp"
#include "util/unicode.hpp"

namespace tonsentry::text {

std::string DecodeComment(std::string_view input) {
  return DecodeComment(input, config::DefaultDecoderConfig());
}

std::string DecodeComment(std::string_view input, const config::DecoderConfig& cfg) {
  if (input.empty()) {
    return {};
  }
  if (input.size() > cfg.max_encoded_comment_bytes) {
    util::LogDebug("comment payload of " + std::to_string(input.size()) +
                   " bytes exceeds the decode cap");
    return cfg.oversized_payload_placeholder;
  }
  try {
    std::vector<std::uint8_t> bytes;
    if (!util::Base64Decode(input, &bytes)) {
      return {};
    }
    const std::string text = util::RepairUtf8(
        std::string_view(reinterpret_cast<const char*>(bytes.data()), bytes.size()));
    return Defang(StripNonPrintable(text));
  } catch (const std::exception& ex) {
    util::LogWarn(std::string("comment decode failed: ") + ex.what());
    return {};
  }
}

}  // namespace tonsentry::text

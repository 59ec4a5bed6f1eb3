#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace tonsentry::util {

// Decoder for comment payloads coming from indexers and wallets. Accepts both
// the standard and URL-safe alphabets (mixing them is allowed), ignores ASCII
// whitespace and requires canonical '=' padding. Returns false on any
// character outside the alphabets or a malformed length/padding.
bool Base64Decode(std::string_view input, std::vector<std::uint8_t>* out);

}  // namespace tonsentry::util

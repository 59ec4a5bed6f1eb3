#pragma once

#include <string>
#include <string_view>

#include "config/decoder_config.hpp"

namespace tonsentry::text {

// Decodes a base64 comment payload into display-safe text. Never throws.
//
//   empty input                         -> ""
//   input longer than the size cap      -> the oversized-payload placeholder
//   not base64                          -> ""
//   otherwise: lossy UTF-8 decode, StripNonPrintable, Defang
std::string DecodeComment(std::string_view input);
std::string DecodeComment(std::string_view input, const config::DecoderConfig& cfg);

}  // namespace tonsentry::text

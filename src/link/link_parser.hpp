#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "config/decoder_config.hpp"
#include "util/decimal.hpp"

namespace tonsentry::link {

// Stages of the transfer-link pipeline, in execution order.
enum class LinkStage {
  kNone,
  kSanitize,
  kLocateIntent,
  kExtractAddress,
  kParseParameters,
  kClassifyPayload,
  kComplete,
};

enum class PayloadKind {
  kContractCall,  // bin= / body=
  kStateInit,     // init=
  kBoth,
};

inline constexpr std::string_view kWarningSeparator = "; ";
inline constexpr std::string_view kWarningNonStandardUrl = "Non-standard URL structure detected";
inline constexpr std::string_view kWarningMalformedAddress = "Invalid or malformed address";
inline constexpr std::string_view kWarningInvalidAmount = "Invalid amount ignored";
inline constexpr std::string_view kWarningBinaryPayload =
    "Binary payload detected (potential smart contract call)";
inline constexpr std::string_view kWarningStateInit = "State init detected (contract deployment)";

struct LinkParseResult {
  bool valid{false};
  // Set iff |valid|.
  std::optional<std::string> destination;
  // Whole coins.
  util::Decimal amount;
  // Defanged.
  std::optional<std::string> comment;
  bool has_payload{false};
  std::optional<PayloadKind> payload_kind;
  // Every anomaly seen, joined with kWarningSeparator.
  std::optional<std::string> warning;
  LinkStage stage_reached{LinkStage::kNone};

  void AddWarning(std::string_view text);
};

// Parses a ton://transfer deep link (or a known web-gateway mirror of one)
// into a validated transfer intent. Never throws: input without a transfer
// marker yields the default result, a missing address yields valid=false
// with a warning, and internal faults are reported as "Parser error: ...".
LinkParseResult ParseLink(std::string_view raw_uri);
LinkParseResult ParseLink(std::string_view raw_uri, const config::DecoderConfig& cfg);

// Stage 1 on its own: percent-decode, NFKC, strip ASCII controls and all
// whitespace, rewrite mirror prefixes to cfg.transfer_prefix.
std::string SanitizeLink(std::string_view raw_uri, const config::DecoderConfig& cfg);

// "1500000000" -> 1.5 (nanotons), "1.5" -> 1.5 (whole coins).
bool ParseLinkAmount(std::string_view raw, util::Decimal* out);

const char* LinkStageName(LinkStage stage);
const char* PayloadKindName(PayloadKind kind);

nlohmann::json ToJson(const LinkParseResult& result);

}  // namespace tonsentry::link

#include "link/link_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <exception>

#include <unicode/uchar.h>
#include <unicode/unistr.h>

#include "link/address.hpp"
#include "link/query.hpp"
#include "text/sanitizer.hpp"
#include "util/logging.hpp"
#include "util/unicode.hpp"

namespace tonsentry::link {

namespace {

constexpr std::string_view kIntentMarker = "transfer/";
constexpr unsigned kNanotonDecimals = 9;

std::string AsciiLower(std::string_view text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lower;
}

bool StartsWithIgnoreCase(std::string_view text, std::string_view prefix) {
  if (text.size() < prefix.size()) {
    return false;
  }
  return AsciiLower(text.substr(0, prefix.size())) == AsciiLower(prefix);
}

std::string StripControlsAndWhitespace(std::string_view text) {
  const icu::UnicodeString source = util::ToUnicode(text);
  icu::UnicodeString kept;
  std::int32_t index = 0;
  while (index < source.length()) {
    const UChar32 cp = source.char32At(index);
    index = source.moveIndex32(index, 1);
    if (cp <= 0x1F || cp == 0x7F || u_isUWhiteSpace(cp)) {
      continue;
    }
    kept.append(cp);
  }
  return util::ToUtf8(kept);
}

nlohmann::json OptionalString(const std::optional<std::string>& value) {
  if (!value) {
    return nullptr;
  }
  return *value;
}

void ParseParameters(std::string_view query, LinkParseResult* result) {
  const auto params = ParseQueryString(query);

  if (auto amount = LastValue(params, "amount")) {
    util::Decimal parsed;
    if (ParseLinkAmount(*amount, &parsed)) {
      result->amount = parsed;
    } else {
      result->AddWarning(kWarningInvalidAmount);
    }
  }

  // Query values are decoded a second time here, so escapes that survived
  // stage 1 as "%251b" only become control characters now.
  if (auto comment = LastValue(params, "text")) {
    result->comment = text::Defang(text::StripNonPrintable(*comment));
  }

  const bool has_call = HasParam(params, "bin") || HasParam(params, "body");
  const bool has_init = HasParam(params, "init");

  result->stage_reached = LinkStage::kClassifyPayload;
  if (has_call) {
    result->has_payload = true;
    result->payload_kind = PayloadKind::kContractCall;
    result->AddWarning(kWarningBinaryPayload);
  }
  if (has_init) {
    result->has_payload = true;
    result->payload_kind = has_call ? PayloadKind::kBoth : PayloadKind::kStateInit;
    result->AddWarning(kWarningStateInit);
  }
}

LinkParseResult ParseLinkUnchecked(std::string_view raw_uri, const config::DecoderConfig& cfg) {
  LinkParseResult result;
  if (raw_uri.empty()) {
    return result;
  }

  // Stage 1: sanitize.
  result.stage_reached = LinkStage::kSanitize;
  const std::string clean = SanitizeLink(raw_uri, cfg);

  // Stage 2: locate the transfer intent. Anything else is simply not a
  // transfer link.
  result.stage_reached = LinkStage::kLocateIntent;
  const auto marker = AsciiLower(clean).find(kIntentMarker);
  if (marker == std::string::npos) {
    return result;
  }
  const std::string_view tail = std::string_view(clean).substr(marker + kIntentMarker.size());

  // Stage 3: extract and validate the address.
  result.stage_reached = LinkStage::kExtractAddress;
  const auto query_start = tail.find('?');
  std::string token(tail.substr(0, query_start));
  token.erase(std::remove(token.begin(), token.end(), '/'), token.end());

  std::string destination;
  if (IsValidAddress(token)) {
    destination = token;
  } else if (FindAddress(token, &destination)) {
    result.AddWarning(kWarningNonStandardUrl);
    util::LogDebug("transfer link address recovered from a non-standard token");
  } else {
    result.AddWarning(kWarningMalformedAddress);
    return result;
  }
  result.destination = destination;
  result.valid = true;

  // Stages 4 and 5: parameters and payload classification.
  result.stage_reached = LinkStage::kParseParameters;
  if (query_start != std::string_view::npos) {
    ParseParameters(tail.substr(query_start + 1), &result);
  }
  result.stage_reached = LinkStage::kComplete;
  return result;
}

}  // namespace

void LinkParseResult::AddWarning(std::string_view text) {
  if (!warning || warning->empty()) {
    warning = std::string(text);
    return;
  }
  warning->append(kWarningSeparator);
  warning->append(text);
}

std::string SanitizeLink(std::string_view raw_uri, const config::DecoderConfig& cfg) {
  const std::string decoded = PercentDecode(raw_uri);
  std::string clean = StripControlsAndWhitespace(util::NormalizeNfkc(decoded));
  for (const auto& mirror : cfg.mirror_prefixes) {
    if (StartsWithIgnoreCase(clean, mirror)) {
      clean = cfg.transfer_prefix + clean.substr(mirror.size());
      break;
    }
  }
  return clean;
}

bool ParseLinkAmount(std::string_view raw, util::Decimal* out) {
  if (raw.find('.') != std::string_view::npos) {
    return util::Decimal::Parse(raw, out);
  }
  return util::Decimal::ParseUnits(raw, kNanotonDecimals, out);
}

LinkParseResult ParseLink(std::string_view raw_uri) {
  return ParseLink(raw_uri, config::DefaultDecoderConfig());
}

LinkParseResult ParseLink(std::string_view raw_uri, const config::DecoderConfig& cfg) {
  try {
    return ParseLinkUnchecked(raw_uri, cfg);
  } catch (const std::exception& ex) {
    util::LogWarn(std::string("transfer link parse failed: ") + ex.what());
    LinkParseResult failed;
    failed.AddWarning(std::string("Parser error: ") + ex.what());
    return failed;
  }
}

const char* LinkStageName(LinkStage stage) {
  switch (stage) {
    case LinkStage::kNone:
      return "none";
    case LinkStage::kSanitize:
      return "sanitize";
    case LinkStage::kLocateIntent:
      return "locate_intent";
    case LinkStage::kExtractAddress:
      return "extract_address";
    case LinkStage::kParseParameters:
      return "parse_parameters";
    case LinkStage::kClassifyPayload:
      return "classify_payload";
    case LinkStage::kComplete:
      return "complete";
  }
  return "unknown";
}

const char* PayloadKindName(PayloadKind kind) {
  switch (kind) {
    case PayloadKind::kContractCall:
      return "contract_call";
    case PayloadKind::kStateInit:
      return "state_init";
    case PayloadKind::kBoth:
      return "both";
  }
  return "unknown";
}

nlohmann::json ToJson(const LinkParseResult& result) {
  nlohmann::json out;
  out["valid"] = result.valid;
  out["destination"] = OptionalString(result.destination);
  out["amount"] = result.amount.ToString();
  out["comment"] = OptionalString(result.comment);
  out["has_payload"] = result.has_payload;
  out["payload_kind"] = nullptr;
  if (result.payload_kind) {
    out["payload_kind"] = PayloadKindName(*result.payload_kind);
  }
  out["warning"] = OptionalString(result.warning);
  out["stage_reached"] = LinkStageName(result.stage_reached);
  return out;
}

}  // namespace tonsentry::link

#include "event/interpreter.hpp"

#include <cstdint>
#include <exception>
#include <optional>

#include "event/opcodes.hpp"
#include "event/scam_policy.hpp"
#include "text/safe_decoder.hpp"
#include "text/sanitizer.hpp"
#include "util/logging.hpp"

namespace tonsentry::event {

namespace {

constexpr std::string_view kDefaultJettonSymbol = "TOKEN";
constexpr std::string_view kUnreadableAmountNote = " [unreadable amount]";

Direction TransferDirection(const std::optional<std::string>& sender,
                            std::string_view reference_wallet) {
  if (sender && !reference_wallet.empty() && *sender == reference_wallet) {
    return Direction::kOut;
  }
  return Direction::kIn;
}

std::string DisplaySender(const std::optional<std::string>& sender,
                          const config::DecoderConfig& cfg) {
  if (!sender || sender->empty()) {
    return std::string(kUnknownSender);
  }
  return text::SanitizeForDisplay(*sender, cfg.max_display_code_points);
}

// Comments are normally base64 payloads; some indexers hand them over as
// plain text, which the decoder rejects and which is then sanitized as is.
std::string ResolveComment(std::string_view raw, const config::DecoderConfig& cfg) {
  if (raw.empty()) {
    return {};
  }
  std::string decoded = text::DecodeComment(raw, cfg);
  if (!decoded.empty()) {
    return decoded;
  }
  return text::Defang(text::StripNonPrintable(raw));
}

// Amounts that fail to parse stay zero; the note keeps the fault visible.
util::Decimal ResolveAmount(const std::optional<std::string>& raw, unsigned decimals,
                            std::string* description) {
  util::Decimal amount;
  if (!raw) {
    return amount;
  }
  if (!util::Decimal::ParseUnits(*raw, decimals, &amount)) {
    description->append(kUnreadableAmountNote);
    return util::Decimal();
  }
  return amount;
}

unsigned ResolveJettonDecimals(const std::optional<std::int64_t>& declared,
                               const config::DecoderConfig& cfg) {
  if (!declared || *declared < 0 || *declared > cfg.max_jetton_decimals) {
    return static_cast<unsigned>(cfg.default_jetton_decimals);
  }
  return static_cast<unsigned>(*declared);
}

void DescribeTonTransfer(const TonTransferFields& fields, std::string_view reference_wallet,
                         const config::DecoderConfig& cfg, EventInterpretation* out) {
  out->action = "TON Transfer";
  out->direction = TransferDirection(fields.sender, reference_wallet);
  out->sender = DisplaySender(fields.sender, cfg);
  out->currency = cfg.native_currency;

  const std::string comment = ResolveComment(
      fields.comment && !fields.comment->empty() ? *fields.comment : fields.payload.value_or(""),
      cfg);
  if (!comment.empty()) {
    out->description = "Msg: " + comment;
  } else if (fields.encrypted_comment) {
    out->description = "Encrypted Msg";
  } else {
    out->description = "Direct Transfer";
  }
  out->amount = ResolveAmount(fields.amount, cfg.native_decimals, &out->description);
}

void DescribeJettonTransfer(const JettonTransferFields& fields, std::string_view reference_wallet,
                            const config::DecoderConfig& cfg, EventInterpretation* out) {
  const std::string raw_symbol =
      fields.symbol && !fields.symbol->empty() ? *fields.symbol : std::string(kDefaultJettonSymbol);
  std::string symbol = text::SanitizeForDisplay(raw_symbol, cfg.max_display_code_points);
  if (symbol.empty()) {
    symbol = std::string(kDefaultJettonSymbol);
  }
  const unsigned decimals = ResolveJettonDecimals(fields.decimals, cfg);

  out->action = symbol + " Transfer";
  out->direction = TransferDirection(fields.sender, reference_wallet);
  out->sender = DisplaySender(fields.sender, cfg);
  out->currency = symbol;

  std::string unreadable;
  out->amount = ResolveAmount(fields.amount, decimals, &unreadable);
  out->description = "Volume: " + out->amount.ToDisplayString() + " " + symbol + unreadable;

  if (fields.comment && !fields.comment->empty()) {
    const std::string comment = text::Defang(text::StripNonPrintable(*fields.comment));
    if (!comment.empty()) {
      out->description += " | Msg: " + comment;
    }
  }

  if (const auto pattern = FindScamPattern(raw_symbol, cfg.scam_symbol_patterns)) {
    out->is_scam_risk = true;
    out->description += kScamWarningSuffix;
    util::LogDebug("jetton symbol matched scam pattern '" + *pattern + "'");
  }
}

void DescribeContractDeploy(EventInterpretation* out) {
  out->action = "Contract Deploy";
  out->description = "Deploying a new smart contract";
  out->direction = Direction::kNeutral;
}

void DescribeContractExec(const SmartContractExecFields& fields, const config::DecoderConfig& cfg,
                          EventInterpretation* out) {
  out->direction = Direction::kNeutral;
  out->currency = cfg.native_currency;

  const std::string raw = fields.operation.value_or("");
  std::uint32_t code = 0;
  std::optional<std::string_view> name;
  if (ParseOpcode(raw, &code)) {
    name = LookupOpcodeName(code);
    out->description = "Op: " + FormatOpcode(code);
  } else if (raw.empty()) {
    out->description = "Op: unknown";
  } else {
    out->description = "Op: " + text::SanitizeForDisplay(raw, cfg.max_display_code_points);
  }
  out->action = std::string(name.value_or(kUnknownOperationName));
  out->amount = ResolveAmount(fields.ton_attached, cfg.native_decimals, &out->description);
}

EventInterpretation InterpretUnchecked(const RawEvent& event, std::string_view reference_wallet,
                                       const config::DecoderConfig& cfg) {
  EventInterpretation result;
  result.currency = cfg.native_currency;
  if (event.actions.empty()) {
    return result;
  }
  const RawAction& primary = event.actions.front();
  switch (primary.kind) {
    case ActionKind::kTonTransfer:
      DescribeTonTransfer(primary.ton_transfer, reference_wallet, cfg, &result);
      break;
    case ActionKind::kJettonTransfer:
      DescribeJettonTransfer(primary.jetton_transfer, reference_wallet, cfg, &result);
      break;
    case ActionKind::kContractDeploy:
      DescribeContractDeploy(&result);
      break;
    case ActionKind::kSmartContractExec:
      DescribeContractExec(primary.contract_exec, cfg, &result);
      break;
    case ActionKind::kUnrecognized:
      break;
  }
  return result;
}

EventInterpretation FailedInterpretation(const std::string& reason,
                                         const config::DecoderConfig& cfg) {
  EventInterpretation failed;
  failed.currency = cfg.native_currency;
  failed.description =
      "Interpretation error: " + text::SanitizeForDisplay(reason, cfg.max_display_code_points);
  return failed;
}

}  // namespace

EventInterpretation Interpret(const RawEvent& event, std::string_view reference_wallet) {
  return Interpret(event, reference_wallet, config::DefaultDecoderConfig());
}

EventInterpretation Interpret(const RawEvent& event, std::string_view reference_wallet,
                              const config::DecoderConfig& cfg) {
  try {
    return InterpretUnchecked(event, reference_wallet, cfg);
  } catch (const std::exception& ex) {
    util::LogWarn(std::string("event interpretation failed: ") + ex.what());
    return FailedInterpretation(ex.what(), cfg);
  }
}

EventInterpretation InterpretJson(const nlohmann::json& event, std::string_view reference_wallet) {
  return InterpretJson(event, reference_wallet, config::DefaultDecoderConfig());
}

EventInterpretation InterpretJson(const nlohmann::json& event, std::string_view reference_wallet,
                                  const config::DecoderConfig& cfg) {
  RawEvent raw;
  std::string error;
  try {
    if (!ParseRawEvent(event, &raw, &error)) {
      util::LogDebug("event rejected: " + error);
      return FailedInterpretation(error, cfg);
    }
  } catch (const std::exception& ex) {
    util::LogWarn(std::string("event parse failed: ") + ex.what());
    return FailedInterpretation(ex.what(), cfg);
  }
  return Interpret(raw, reference_wallet, cfg);
}

const char* DirectionName(Direction direction) {
  switch (direction) {
    case Direction::kIn:
      return "in";
    case Direction::kOut:
      return "out";
    case Direction::kNeutral:
      return "neutral";
  }
  return "neutral";
}

nlohmann::json ToJson(const EventInterpretation& interpretation) {
  nlohmann::json out;
  out["action"] = interpretation.action;
  out["direction"] = DirectionName(interpretation.direction);
  out["description"] = interpretation.description;
  out["is_scam_risk"] = interpretation.is_scam_risk;
  out["sender"] = interpretation.sender;
  out["amount"] = interpretation.amount.ToString();
  out["currency"] = interpretation.currency;
  return out;
}

}  // namespace tonsentry::event

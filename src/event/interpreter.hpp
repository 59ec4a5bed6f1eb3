#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "config/decoder_config.hpp"
#include "event/raw_event.hpp"
#include "util/decimal.hpp"

namespace tonsentry::event {

enum class Direction {
  kIn,
  kOut,
  kNeutral,
};

inline constexpr std::string_view kUnknownSender = "Unknown";
inline constexpr std::string_view kScamWarningSuffix = " [WARNING: possible scam token]";

struct EventInterpretation {
  std::string action{"Transaction"};
  Direction direction{Direction::kNeutral};
  // Display text; every attacker-controlled fragment is sanitized.
  std::string description{"Interaction"};
  bool is_scam_risk{false};
  std::string sender{kUnknownSender};
  util::Decimal amount;
  std::string currency{"TON"};
};

// Describes the first action of |event| relative to |reference_wallet|.
// Later actions are ignored. Transfers are kOut iff the sender equals
// |reference_wallet| exactly (an empty wallet never matches) and kIn
// otherwise; deploys and contract calls are kNeutral. Never throws: an
// internal fault yields the default result with an "Interpretation error"
// description.
EventInterpretation Interpret(const RawEvent& event, std::string_view reference_wallet);
EventInterpretation Interpret(const RawEvent& event, std::string_view reference_wallet,
                              const config::DecoderConfig& cfg);

// ParseRawEvent + Interpret. A document that is not an event object is
// reported in the description of an otherwise default result.
EventInterpretation InterpretJson(const nlohmann::json& event, std::string_view reference_wallet);
EventInterpretation InterpretJson(const nlohmann::json& event, std::string_view reference_wallet,
                                  const config::DecoderConfig& cfg);

const char* DirectionName(Direction direction);

nlohmann::json ToJson(const EventInterpretation& interpretation);

}  // namespace tonsentry::event

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace tonsentry::event {

// Action kinds understood by the interpreter. Anything else is kept as
// kUnrecognized so new indexer shapes fail closed instead of being read
// through guessed field names.
enum class ActionKind {
  kUnrecognized,
  kTonTransfer,
  kJettonTransfer,
  kContractDeploy,
  kSmartContractExec,
};

struct TonTransferFields {
  std::optional<std::string> sender;
  std::optional<std::string> recipient;
  // Nanotons as a decimal digit string.
  std::optional<std::string> amount;
  std::optional<std::string> comment;
  std::optional<std::string> encrypted_comment;
  std::optional<std::string> payload;
};

struct JettonTransferFields {
  std::optional<std::string> sender;
  std::optional<std::string> recipient;
  // Smallest token units as a decimal digit string.
  std::optional<std::string> amount;
  std::optional<std::string> comment;
  std::optional<std::string> symbol;
  std::optional<std::string> name;
  std::optional<std::string> jetton_address;
  // Absent when missing, non-integral or out of the int64 range.
  std::optional<std::int64_t> decimals;
};

struct ContractDeployFields {
  std::optional<std::string> address;
  std::vector<std::string> interfaces;
};

struct SmartContractExecFields {
  std::optional<std::string> executor;
  std::optional<std::string> contract;
  std::optional<std::string> ton_attached;
  // Operation code as received: "0x0f8a7ea5", "260734629" or a name.
  std::optional<std::string> operation;
  std::optional<std::string> payload;
};

struct RawAction {
  ActionKind kind{ActionKind::kUnrecognized};
  // Declared "type" string, kept for diagnostics.
  std::string type;
  // Only the member matching |kind| is populated.
  TonTransferFields ton_transfer;
  JettonTransferFields jetton_transfer;
  ContractDeployFields contract_deploy;
  SmartContractExecFields contract_exec;
};

struct RawEvent {
  std::optional<std::string> event_id;
  std::vector<RawAction> actions;
};

ActionKind ActionKindFromString(std::string_view type);
const char* ActionKindName(ActionKind kind);

// Builds a RawEvent from an indexer event object. Field types are checked
// before every access; a wrongly typed field is treated as absent. Returns
// false only when |json| is not an object or "actions" is present but not
// an array.
bool ParseRawEvent(const nlohmann::json& json, RawEvent* out, std::string* error);

// Same, from JSON text. Invalid JSON returns false.
bool ParseRawEventText(std::string_view text, RawEvent* out, std::string* error);

}  // namespace tonsentry::event

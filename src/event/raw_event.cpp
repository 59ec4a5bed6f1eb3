#include "event/raw_event.hpp"

#include <charconv>
#include <limits>

namespace tonsentry::event {

namespace {

using nlohmann::json;

const json* Member(const json& object, const char* key) {
  if (!object.is_object()) {
    return nullptr;
  }
  const auto it = object.find(key);
  if (it == object.end()) {
    return nullptr;
  }
  return &*it;
}

std::optional<std::string> StringField(const json& object, const char* key) {
  const json* value = Member(object, key);
  if (!value || !value->is_string()) {
    return std::nullopt;
  }
  return value->get<std::string>();
}

// Accounts are {"address": "..."} objects in the indexer schema; a bare
// string is accepted too.
std::optional<std::string> AccountField(const json& object, const char* key) {
  const json* value = Member(object, key);
  if (!value) {
    return std::nullopt;
  }
  if (value->is_string()) {
    return value->get<std::string>();
  }
  return StringField(*value, "address");
}

// Amounts may be encoded as strings or as JSON integers. Floating point and
// negative numbers are refused here rather than rounded.
std::optional<std::string> AmountField(const json& object, const char* key) {
  const json* value = Member(object, key);
  if (!value) {
    return std::nullopt;
  }
  if (value->is_string()) {
    return value->get<std::string>();
  }
  if (value->is_number_unsigned()) {
    return std::to_string(value->get<std::uint64_t>());
  }
  if (value->is_number_integer() && value->get<std::int64_t>() >= 0) {
    return std::to_string(value->get<std::int64_t>());
  }
  return std::nullopt;
}

std::optional<std::int64_t> IntegerField(const json& object, const char* key) {
  const json* value = Member(object, key);
  if (!value) {
    return std::nullopt;
  }
  if (value->is_number_unsigned()) {
    const auto unsigned_value = value->get<std::uint64_t>();
    if (unsigned_value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(unsigned_value);
  }
  if (value->is_number_integer()) {
    return value->get<std::int64_t>();
  }
  if (value->is_string()) {
    const auto text = value->get<std::string>();
    std::int64_t parsed = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc() || ptr != end || text.empty()) {
      return std::nullopt;
    }
    return parsed;
  }
  return std::nullopt;
}

// Operation codes show up as hex strings, decimal strings or plain numbers.
std::optional<std::string> OperationField(const json& object, const char* key) {
  const json* value = Member(object, key);
  if (!value) {
    return std::nullopt;
  }
  if (value->is_string()) {
    return value->get<std::string>();
  }
  if (value->is_number_unsigned()) {
    return std::to_string(value->get<std::uint64_t>());
  }
  if (value->is_number_integer()) {
    return std::to_string(value->get<std::int64_t>());
  }
  return std::nullopt;
}

void ParseTonTransfer(const json& body, TonTransferFields* out) {
  out->sender = AccountField(body, "sender");
  out->recipient = AccountField(body, "recipient");
  out->amount = AmountField(body, "amount");
  out->comment = StringField(body, "comment");
  out->encrypted_comment = StringField(body, "encrypted_comment");
  out->payload = StringField(body, "payload");
}

void ParseJettonTransfer(const json& body, JettonTransferFields* out) {
  out->sender = AccountField(body, "sender");
  out->recipient = AccountField(body, "recipient");
  out->amount = AmountField(body, "amount");
  out->comment = StringField(body, "comment");
  if (const json* jetton = Member(body, "jetton")) {
    out->symbol = StringField(*jetton, "symbol");
    out->name = StringField(*jetton, "name");
    out->jetton_address = StringField(*jetton, "address");
    out->decimals = IntegerField(*jetton, "decimals");
  }
}

void ParseContractDeploy(const json& body, ContractDeployFields* out) {
  out->address = StringField(body, "address");
  if (const json* interfaces = Member(body, "interfaces"); interfaces && interfaces->is_array()) {
    for (const auto& item : *interfaces) {
      if (item.is_string()) {
        out->interfaces.push_back(item.get<std::string>());
      }
    }
  }
}

void ParseSmartContractExec(const json& body, SmartContractExecFields* out) {
  out->executor = AccountField(body, "executor");
  out->contract = AccountField(body, "contract");
  out->ton_attached = AmountField(body, "ton_attached");
  out->operation = OperationField(body, "operation");
  out->payload = StringField(body, "payload");
}

RawAction ParseAction(const json& item) {
  RawAction action;
  action.type = StringField(item, "type").value_or("");
  action.kind = ActionKindFromString(action.type);
  if (action.kind == ActionKind::kUnrecognized) {
    return action;
  }
  const json* body = Member(item, ActionKindName(action.kind));
  const json empty = json::object();
  const json& fields = body ? *body : empty;
  switch (action.kind) {
    case ActionKind::kTonTransfer:
      ParseTonTransfer(fields, &action.ton_transfer);
      break;
    case ActionKind::kJettonTransfer:
      ParseJettonTransfer(fields, &action.jetton_transfer);
      break;
    case ActionKind::kContractDeploy:
      ParseContractDeploy(fields, &action.contract_deploy);
      break;
    case ActionKind::kSmartContractExec:
      ParseSmartContractExec(fields, &action.contract_exec);
      break;
    case ActionKind::kUnrecognized:
      break;
  }
  return action;
}

}  // namespace

ActionKind ActionKindFromString(std::string_view type) {
  if (type == "TonTransfer") return ActionKind::kTonTransfer;
  if (type == "JettonTransfer") return ActionKind::kJettonTransfer;
  if (type == "ContractDeploy") return ActionKind::kContractDeploy;
  if (type == "SmartContractExec") return ActionKind::kSmartContractExec;
  return ActionKind::kUnrecognized;
}

const char* ActionKindName(ActionKind kind) {
  switch (kind) {
    case ActionKind::kTonTransfer:
      return "TonTransfer";
    case ActionKind::kJettonTransfer:
      return "JettonTransfer";
    case ActionKind::kContractDeploy:
      return "ContractDeploy";
    case ActionKind::kSmartContractExec:
      return "SmartContractExec";
    case ActionKind::kUnrecognized:
      return "Unrecognized";
  }
  return "Unrecognized";
}

bool ParseRawEvent(const json& object, RawEvent* out, std::string* error) {
  if (!out) {
    if (error) *error = "null output";
    return false;
  }
  *out = RawEvent{};
  if (!object.is_object()) {
    if (error) *error = "event is not a JSON object";
    return false;
  }
  out->event_id = StringField(object, "event_id");
  const json* actions = Member(object, "actions");
  if (!actions || actions->is_null()) {
    return true;
  }
  if (!actions->is_array()) {
    if (error) *error = "event actions is not an array";
    return false;
  }
  out->actions.reserve(actions->size());
  for (const auto& item : *actions) {
    out->actions.push_back(ParseAction(item));
  }
  return true;
}

bool ParseRawEventText(std::string_view text, RawEvent* out, std::string* error) {
  const json parsed = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
  if (parsed.is_discarded()) {
    if (error) *error = "event is not valid JSON";
    return false;
  }
  return ParseRawEvent(parsed, out, error);
}

}  // namespace tonsentry::event

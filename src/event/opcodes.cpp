#include "event/opcodes.hpp"

#include <charconv>
#include <cstdio>

namespace tonsentry::event {

const std::unordered_map<std::uint32_t, std::string_view>& OpcodeTable() {
  static const std::unordered_map<std::uint32_t, std::string_view> table{
      {kOpTextComment, "Text Comment"},
      {kOpEncryptedComment, "Encrypted Comment"},
      {kOpJettonTransfer, "Jetton Transfer"},
      {kOpJettonInternalTransfer, "Jetton Internal Transfer"},
      {kOpJettonNotify, "Jetton Transfer Notification"},
      {kOpJettonBurn, "Jetton Burn"},
      {kOpJettonBurnNotification, "Jetton Burn Notification"},
      {kOpExcesses, "Excesses (Cashback)"},
      {kOpNftTransfer, "NFT Transfer"},
      {kOpNftOwnershipAssigned, "NFT Ownership Assigned"},
      {kOpGetStaticData, "Get Static Data"},
      {kOpReportStaticData, "Report Static Data"},
      {kOpWalletInternalSignedRequest, "Wallet Signed Request (internal)"},
      {kOpWalletExternalSignedRequest, "Wallet Signed Request (external)"},
      {kOpWalletExtensionAction, "Wallet Extension Action"},
      {kOpHighloadInternalRequest, "Highload Wallet Request"},
      {kOpRecoverStakeOk, "Recover Stake OK"},
  };
  return table;
}

std::optional<std::string_view> LookupOpcodeName(std::uint32_t code) {
  const auto& table = OpcodeTable();
  const auto it = table.find(code);
  if (it == table.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool ParseOpcode(std::string_view text, std::uint32_t* code) {
  if (!code || text.empty()) {
    return false;
  }
  int base = 10;
  if (text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
    text.remove_prefix(2);
    base = 16;
  }
  std::uint32_t value = 0;
  const char* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value, base);
  if (ec != std::errc() || ptr != end) {
    return false;
  }
  *code = value;
  return true;
}

std::string FormatOpcode(std::uint32_t code) {
  char buffer[11];
  std::snprintf(buffer, sizeof(buffer), "0x%08x", static_cast<unsigned>(code));
  return std::string(buffer);
}

}  // namespace tonsentry::event

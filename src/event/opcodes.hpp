#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace tonsentry::event {

inline constexpr std::uint32_t kOpTextComment = 0x00000000;
inline constexpr std::uint32_t kOpEncryptedComment = 0x2167da4b;
inline constexpr std::uint32_t kOpJettonTransfer = 0x0f8a7ea5;
inline constexpr std::uint32_t kOpJettonInternalTransfer = 0x178d4519;
inline constexpr std::uint32_t kOpJettonNotify = 0x7362d09c;
inline constexpr std::uint32_t kOpJettonBurn = 0x595f07bc;
inline constexpr std::uint32_t kOpJettonBurnNotification = 0x7bdd97de;
inline constexpr std::uint32_t kOpExcesses = 0xd53276db;
inline constexpr std::uint32_t kOpNftTransfer = 0x5fcc3d14;
inline constexpr std::uint32_t kOpNftOwnershipAssigned = 0x05138d91;
inline constexpr std::uint32_t kOpGetStaticData = 0x2fcb26a2;
inline constexpr std::uint32_t kOpReportStaticData = 0x8b771735;
inline constexpr std::uint32_t kOpWalletInternalSignedRequest = 0x73696e74;
inline constexpr std::uint32_t kOpWalletExternalSignedRequest = 0x7369676e;
inline constexpr std::uint32_t kOpWalletExtensionAction = 0x6578746e;
inline constexpr std::uint32_t kOpHighloadInternalRequest = 0xae42e5a4;
inline constexpr std::uint32_t kOpRecoverStakeOk = 0xf96f7324;

inline constexpr std::string_view kUnknownOperationName = "Call Contract";

// Immutable code -> display name table, built on first use.
const std::unordered_map<std::uint32_t, std::string_view>& OpcodeTable();

std::optional<std::string_view> LookupOpcodeName(std::uint32_t code);

// Accepts "0x"-prefixed hex ("0x0f8a7ea5") or a decimal string that fits in
// 32 bits. Everything else is rejected.
bool ParseOpcode(std::string_view text, std::uint32_t* code);

// "0x0f8a7ea5"
std::string FormatOpcode(std::uint32_t code);

}  // namespace tonsentry::event

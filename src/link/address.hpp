#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace tonsentry::link {

enum class AddressForm {
  kUserFriendly,  // 48 chars of the URL-safe base64 alphabet
  kRaw,           // [-]wc:64-hex, wc in {0, 1}
};

inline constexpr std::size_t kUserFriendlyAddressLength = 48;
inline constexpr std::size_t kRawAddressHexLength = 64;

// Grammar check only; no checksum or CRC verification. The whole |token|
// must match.
bool IsValidAddress(std::string_view token, AddressForm* form = nullptr);

// Leftmost substring of |token| that matches the address grammar. At each
// position the raw form is tried before the user-friendly form.
bool FindAddress(std::string_view token, std::string* match, AddressForm* form = nullptr);

}  // namespace tonsentry::link

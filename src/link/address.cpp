#include "link/address.hpp"

namespace tonsentry::link {

namespace {

bool IsUrlSafeBase64Char(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
         c == '-' || c == '_';
}

bool IsHexChar(char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

// Length of the raw-form address starting at the beginning of |text|, or 0.
std::size_t MatchRawPrefix(std::string_view text) {
  std::size_t pos = 0;
  if (pos < text.size() && text[pos] == '-') {
    ++pos;
  }
  if (pos >= text.size() || (text[pos] != '0' && text[pos] != '1')) {
    return 0;
  }
  ++pos;
  if (pos >= text.size() || text[pos] != ':') {
    return 0;
  }
  ++pos;
  if (text.size() - pos < kRawAddressHexLength) {
    return 0;
  }
  for (std::size_t i = 0; i < kRawAddressHexLength; ++i) {
    if (!IsHexChar(text[pos + i])) {
      return 0;
    }
  }
  return pos + kRawAddressHexLength;
}

bool MatchUserFriendlyPrefix(std::string_view text) {
  if (text.size() < kUserFriendlyAddressLength) {
    return false;
  }
  for (std::size_t i = 0; i < kUserFriendlyAddressLength; ++i) {
    if (!IsUrlSafeBase64Char(text[i])) {
      return false;
    }
  }
  return true;
}

}  // namespace

bool IsValidAddress(std::string_view token, AddressForm* form) {
  if (token.size() == kUserFriendlyAddressLength && MatchUserFriendlyPrefix(token)) {
    if (form) *form = AddressForm::kUserFriendly;
    return true;
  }
  const std::size_t raw = MatchRawPrefix(token);
  if (raw != 0 && raw == token.size()) {
    if (form) *form = AddressForm::kRaw;
    return true;
  }
  return false;
}

bool FindAddress(std::string_view token, std::string* match, AddressForm* form) {
  for (std::size_t start = 0; start < token.size(); ++start) {
    const std::string_view rest = token.substr(start);
    if (const std::size_t raw = MatchRawPrefix(rest); raw != 0) {
      if (match) *match = std::string(rest.substr(0, raw));
      if (form) *form = AddressForm::kRaw;
      return true;
    }
    if (MatchUserFriendlyPrefix(rest)) {
      if (match) *match = std::string(rest.substr(0, kUserFriendlyAddressLength));
      if (form) *form = AddressForm::kUserFriendly;
      return true;
    }
  }
  return false;
}

}  // namespace tonsentry::link

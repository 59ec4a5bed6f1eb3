#include "util/base64.hpp"

#include <array>
#include <cctype>

namespace tonsentry::util {

namespace {

constexpr std::string_view kStandardAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr std::string_view kUrlSafeAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

constexpr int kInvalid = -1;
constexpr int kPadding = -2;

constexpr std::array<int, 256> BuildDecodeTable() {
  std::array<int, 256> table{};
  table.fill(kInvalid);
  for (std::size_t i = 0; i < kStandardAlphabet.size(); ++i) {
    table[static_cast<unsigned char>(kStandardAlphabet[i])] = static_cast<int>(i);
    table[static_cast<unsigned char>(kUrlSafeAlphabet[i])] = static_cast<int>(i);
  }
  table[static_cast<unsigned char>('=')] = kPadding;
  return table;
}

constexpr auto kDecodeTable = BuildDecodeTable();

}  // namespace

bool Base64Decode(std::string_view input, std::vector<std::uint8_t>* out) {
  if (!out) {
    return false;
  }
  out->clear();
  out->reserve((input.size() * 3) / 4);
  std::uint32_t val = 0;
  int valb = -8;
  std::size_t symbols = 0;
  std::size_t padding = 0;

  for (unsigned char c : input) {
    if (std::isspace(c)) {
      continue;
    }
    const int decoded = kDecodeTable[c];
    if (decoded == kInvalid) {
      out->clear();
      return false;
    }
    if (decoded == kPadding) {
      ++padding;
      continue;
    }
    if (padding > 0) {
      // Data after '=' is never canonical.
      out->clear();
      return false;
    }
    ++symbols;
    val = (val << 6) | static_cast<std::uint32_t>(decoded);
    valb += 6;
    if (valb >= 0) {
      out->push_back(static_cast<std::uint8_t>((val >> valb) & 0xff));
      valb -= 8;
    }
  }

  // A lone trailing symbol carries fewer than 8 bits and the padding must
  // complete the final quantum exactly.
  const std::size_t remainder = symbols % 4;
  if (remainder == 1 || padding > 2 || padding != (4 - remainder) % 4) {
    out->clear();
    return false;
  }
  return true;
}

}  // namespace tonsentry::util

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <boost/multiprecision/cpp_int.hpp>

namespace tonsentry::util {

// Exact non-negative fixed-point number: value = units / 10^scale.
//
// Coin and token amounts arrive as integer strings of the smallest unit and
// are shifted by the token's decimal count. Keeping the mantissa as an
// arbitrary-precision integer makes that shift exact for any decimal count,
// so no amount ever passes through binary floating point.
class Decimal {
 public:
  using Integer = boost::multiprecision::cpp_int;

  // Inputs longer than this are rejected; a uint256 has 78 digits.
  static constexpr std::size_t kMaxDigits = 96;

  Decimal() = default;
  Decimal(Integer units, unsigned scale);

  // Parses "123", "0.5", "12.000" (digits with at most one '.').
  static bool Parse(std::string_view text, Decimal* out);

  // Parses an integer count of the smallest unit and divides it by
  // 10^decimals, e.g. ("1500000000", 9) -> 1.5.
  static bool ParseUnits(std::string_view digits, unsigned decimals, Decimal* out);

  const Integer& units() const { return units_; }
  unsigned scale() const { return scale_; }
  bool IsZero() const { return units_ == 0; }

  // Same value with trailing fractional zeros removed.
  Decimal Normalized() const;

  // Canonical form: "1", "1.5", "0.000000001".
  std::string ToString() const;

  // Canonical form with ',' thousands separators in the integer part.
  std::string ToDisplayString() const;

  friend bool operator==(const Decimal& a, const Decimal& b);
  friend bool operator!=(const Decimal& a, const Decimal& b) { return !(a == b); }
  friend bool operator<(const Decimal& a, const Decimal& b);

 private:
  Integer units_{0};
  unsigned scale_{0};
};

}  // namespace tonsentry::util

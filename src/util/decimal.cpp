#include "util/decimal.hpp"

#include <algorithm>
#include <utility>

namespace tonsentry::util {

namespace {

using Integer = Decimal::Integer;

Integer PowerOfTen(unsigned exponent) {
  Integer result = 1;
  for (unsigned i = 0; i < exponent; ++i) {
    result *= 10;
  }
  return result;
}

bool AllDigits(std::string_view text) {
  return std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; });
}

Integer DigitsToInteger(std::string_view digits) {
  Integer value = 0;
  for (char c : digits) {
    value *= 10;
    value += static_cast<unsigned>(c - '0');
  }
  return value;
}

// Brings both operands to the larger scale so their mantissas compare directly.
std::pair<Integer, Integer> AlignedUnits(const Decimal& a, const Decimal& b) {
  if (a.scale() == b.scale()) {
    return {a.units(), b.units()};
  }
  if (a.scale() < b.scale()) {
    return {a.units() * PowerOfTen(b.scale() - a.scale()), b.units()};
  }
  return {a.units(), b.units() * PowerOfTen(a.scale() - b.scale())};
}

std::string GroupThousands(const std::string& digits) {
  std::string grouped;
  grouped.reserve(digits.size() + digits.size() / 3);
  const std::size_t lead = digits.size() % 3;
  for (std::size_t i = 0; i < digits.size(); ++i) {
    if (i != 0 && i >= lead && (i - lead) % 3 == 0) {
      grouped.push_back(',');
    }
    grouped.push_back(digits[i]);
  }
  return grouped;
}

}  // namespace

Decimal::Decimal(Integer units, unsigned scale) : units_(std::move(units)), scale_(scale) {}

bool Decimal::Parse(std::string_view text, Decimal* out) {
  if (!out || text.empty() || text.size() > kMaxDigits + 1) {
    return false;
  }
  const auto dot = text.find('.');
  if (dot == std::string_view::npos) {
    if (!AllDigits(text)) {
      return false;
    }
    *out = Decimal(DigitsToInteger(text), 0);
    return true;
  }
  const std::string_view integral = text.substr(0, dot);
  const std::string_view fractional = text.substr(dot + 1);
  if ((integral.empty() && fractional.empty()) || !AllDigits(integral) ||
      !AllDigits(fractional)) {
    return false;
  }
  std::string digits(integral);
  digits.append(fractional);
  *out = Decimal(DigitsToInteger(digits), static_cast<unsigned>(fractional.size()));
  return true;
}

bool Decimal::ParseUnits(std::string_view digits, unsigned decimals, Decimal* out) {
  if (!out || digits.empty() || digits.size() > kMaxDigits || !AllDigits(digits)) {
    return false;
  }
  *out = Decimal(DigitsToInteger(digits), decimals);
  return true;
}

Decimal Decimal::Normalized() const {
  Integer units = units_;
  unsigned scale = scale_;
  while (scale > 0 && units % 10 == 0) {
    units /= 10;
    --scale;
  }
  if (units == 0) {
    scale = 0;
  }
  return Decimal(std::move(units), scale);
}

std::string Decimal::ToString() const {
  const Decimal canonical = Normalized();
  std::string digits = canonical.units_.str();
  if (canonical.scale_ > 0) {
    if (digits.size() <= canonical.scale_) {
      digits.insert(0, canonical.scale_ - digits.size() + 1, '0');
    }
    digits.insert(digits.size() - canonical.scale_, 1, '.');
  }
  return digits;
}

std::string Decimal::ToDisplayString() const {
  const std::string body = ToString();
  const auto dot = body.find('.');
  std::string result = GroupThousands(body.substr(0, dot));
  if (dot != std::string::npos) {
    result.append(body.substr(dot));
  }
  return result;
}

bool operator==(const Decimal& a, const Decimal& b) {
  const auto [lhs, rhs] = AlignedUnits(a, b);
  return lhs == rhs;
}

bool operator<(const Decimal& a, const Decimal& b) {
  const auto [lhs, rhs] = AlignedUnits(a, b);
  return lhs < rhs;
}

}  // namespace tonsentry::util

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tonsentry::link {

struct QueryParam {
  std::string key;
  std::string value;
};

// Decodes %XX escapes into raw bytes. Malformed escapes are kept verbatim.
// With |plus_as_space| set, '+' decodes to ' ' (form encoding). The result
// may be invalid UTF-8; callers repair it before display.
std::string PercentDecode(std::string_view input, bool plus_as_space = false);

// Splits "a=1&b=2" into pairs in order of appearance. Pairs without '=' and
// pairs with an empty value are dropped; keys and values are form-decoded.
std::vector<QueryParam> ParseQueryString(std::string_view query);

// Value of the last occurrence of |key|, if any.
std::optional<std::string> LastValue(const std::vector<QueryParam>& params, std::string_view key);

bool HasParam(const std::vector<QueryParam>& params, std::string_view key);

}  // namespace tonsentry::link

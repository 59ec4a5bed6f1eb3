#include "link/query.hpp"

#include <utility>

#include "util/unicode.hpp"

namespace tonsentry::link {

namespace {

int FromHex(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

}  // namespace

std::string PercentDecode(std::string_view input, bool plus_as_space) {
  std::string out;
  out.reserve(input.size());
  for (std::size_t i = 0; i < input.size(); ++i) {
    const char c = input[i];
    if (c == '%' && i + 2 < input.size()) {
      const int hi = FromHex(input[i + 1]);
      const int lo = FromHex(input[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
        continue;
      }
    }
    if (c == '+' && plus_as_space) {
      out.push_back(' ');
      continue;
    }
    out.push_back(c);
  }
  return out;
}

std::vector<QueryParam> ParseQueryString(std::string_view query) {
  std::vector<QueryParam> params;
  std::size_t pos = 0;
  while (pos <= query.size()) {
    auto end = query.find('&', pos);
    if (end == std::string_view::npos) {
      end = query.size();
    }
    const std::string_view pair = query.substr(pos, end - pos);
    pos = end + 1;
    const auto eq = pair.find('=');
    if (eq == std::string_view::npos) {
      continue;
    }
    const std::string_view value = pair.substr(eq + 1);
    if (value.empty()) {
      continue;
    }
    QueryParam param;
    param.key = util::RepairUtf8(PercentDecode(pair.substr(0, eq), /*plus_as_space=*/true));
    param.value = util::RepairUtf8(PercentDecode(value, /*plus_as_space=*/true));
    params.push_back(std::move(param));
  }
  return params;
}

std::optional<std::string> LastValue(const std::vector<QueryParam>& params, std::string_view key) {
  for (auto it = params.rbegin(); it != params.rend(); ++it) {
    if (it->key == key) {
      return it->value;
    }
  }
  return std::nullopt;
}

bool HasParam(const std::vector<QueryParam>& params, std::string_view key) {
  return LastValue(params, key).has_value();
}

}  // namespace tonsentry::link

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tonsentry::event {

// Canonical form used for denylist matching: NFKC, non-printable code
// points removed (so zero-width characters cannot split a pattern), then
// lower-cased.
std::string ScamMatchKey(std::string_view symbol);

// First pattern from |patterns| (lower-case substrings) contained in the
// canonical form of |symbol|.
std::optional<std::string> FindScamPattern(std::string_view symbol,
                                           const std::vector<std::string>& patterns);

}  // namespace tonsentry::event

#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "config/decoder_config.hpp"
#include "link/address.hpp"
#include "link/link_parser.hpp"
#include "util/decimal.hpp"

using tonsentry::link::LinkParseResult;
using tonsentry::link::LinkStage;
using tonsentry::link::ParseLink;
using tonsentry::link::PayloadKind;
using tonsentry::util::Decimal;

namespace {

const std::string kAddress = "EQD4FPq-PRDieyQKkizFTRtSDyucUIqrj0v_zXJmqaDp6_0t";
const std::string kRawAddress =
    "0:83dfd552e63729b472fcbcc8c45ebcc6691702558b68ec7527e1ba403a0f31a8";

bool ExpectWarning(const LinkParseResult& result, const std::string& expected, const char* label) {
  if (!result.warning || *result.warning != expected) {
    std::cerr << label << ": warning '" << result.warning.value_or("<none>") << "' expected '"
              << expected << "'\n";
    return false;
  }
  return true;
}

bool ExpectValid(const LinkParseResult& result, const std::string& destination,
                 const char* label) {
  if (!result.valid || !result.destination || *result.destination != destination) {
    std::cerr << label << ": expected valid link to " << destination << "\n";
    return false;
  }
  return true;
}

bool ExpectAmount(const LinkParseResult& result, const std::string& expected, const char* label) {
  if (result.amount.ToString() != expected) {
    std::cerr << label << ": amount " << result.amount.ToString() << " expected " << expected
              << "\n";
    return false;
  }
  return true;
}

bool IsDefault(const LinkParseResult& result) {
  return !result.valid && !result.destination && result.amount.IsZero() && !result.comment &&
         !result.has_payload && !result.payload_kind && !result.warning;
}

// Invariants that must hold for any input.
bool CheckInvariants(const LinkParseResult& result) {
  if (result.valid != result.destination.has_value()) return false;
  if (result.destination && !tonsentry::link::IsValidAddress(*result.destination)) return false;
  if (result.has_payload != result.payload_kind.has_value()) return false;
  if (result.comment && (result.comment->find("http://") != std::string::npos ||
                         result.comment->find("https://") != std::string::npos)) {
    return false;
  }
  if (result.comment) {
    for (unsigned char c : *result.comment) {
      if (c < 0x20 || c == 0x7f) return false;
    }
  }
  return true;
}

}  // namespace

int main() {
  const std::string base = "ton://transfer/" + kAddress;

  try {
    {
      const auto result = ParseLink(base + "?amount=1000000000&text=visit%20https://evil.com");
      if (!ExpectValid(result, kAddress, "standard link")) return 1;
      if (result.amount != Decimal(1, 0)) {
        std::cerr << "standard link: amount is not one coin\n";
        return 1;
      }
      if (!result.comment || result.comment->find("hxxps://evil[.]com") == std::string::npos) {
        std::cerr << "standard link: comment not defanged\n";
        return 1;
      }
      if (result.has_payload || result.payload_kind || result.warning ||
          result.stage_reached != LinkStage::kComplete) {
        std::cerr << "standard link: unexpected payload, warning or stage\n";
        return 1;
      }
    }

    if (!IsDefault(ParseLink("")) || !IsDefault(ParseLink("ton://pay/abc")) ||
        !IsDefault(ParseLink("https://example.com/" + kAddress))) {
      std::cerr << "link without transfer marker produced output\n";
      return 1;
    }

    {
      const auto result = ParseLink("ton://transfer/???");
      if (result.valid || result.destination) {
        std::cerr << "garbage address accepted\n";
        return 1;
      }
      if (!ExpectWarning(result, std::string(tonsentry::link::kWarningMalformedAddress),
                         "garbage address")) {
        return 1;
      }
      if (result.stage_reached != LinkStage::kExtractAddress) {
        std::cerr << "garbage address: wrong stage\n";
        return 1;
      }
    }

    {
      const auto result = ParseLink("ton://transfer/!!" + kAddress + "?amount=1.5");
      if (!ExpectValid(result, kAddress, "loose address")) return 1;
      if (!ExpectWarning(result, std::string(tonsentry::link::kWarningNonStandardUrl),
                         "loose address")) {
        return 1;
      }
      if (!ExpectAmount(result, "1.5", "decimal amount")) return 1;
    }

    {
      const auto result = ParseLink(base + "/?amount=5");
      if (!ExpectValid(result, kAddress, "trailing slash") || result.warning) return 1;
      if (!ExpectAmount(result, "0.000000005", "nanoton amount")) return 1;
    }

    {
      const auto result = ParseLink("ton://transfer/" + kRawAddress + "?amount=2000000000");
      if (!ExpectValid(result, kRawAddress, "raw address") || result.warning) return 1;
      if (!ExpectAmount(result, "2", "raw address amount")) return 1;
    }

    {
      const auto result = ParseLink(base + "?bin=te6cc");
      if (!result.has_payload || result.payload_kind != PayloadKind::kContractCall) {
        std::cerr << "bin not classified as contract call\n";
        return 1;
      }
      if (!ExpectWarning(result, std::string(tonsentry::link::kWarningBinaryPayload), "bin")) {
        return 1;
      }
    }

    {
      const auto result = ParseLink(base + "?init=te6cc");
      if (!result.has_payload || result.payload_kind != PayloadKind::kStateInit) {
        std::cerr << "init not classified as state init\n";
        return 1;
      }
    }

    {
      const auto result = ParseLink(base + "?body=abc&init=def");
      if (!result.has_payload || result.payload_kind != PayloadKind::kBoth) {
        std::cerr << "body+init not classified as both\n";
        return 1;
      }
      const std::string expected = std::string(tonsentry::link::kWarningBinaryPayload) +
                                   std::string(tonsentry::link::kWarningSeparator) +
                                   std::string(tonsentry::link::kWarningStateInit);
      if (!ExpectWarning(result, expected, "body+init")) return 1;
    }

    {
      const auto result = ParseLink("ton://transfer/!!" + kAddress + "?bin=x&amount=oops");
      const std::string expected = std::string(tonsentry::link::kWarningNonStandardUrl) + "; " +
                                   std::string(tonsentry::link::kWarningInvalidAmount) + "; " +
                                   std::string(tonsentry::link::kWarningBinaryPayload);
      if (!ExpectWarning(result, expected, "accumulated warnings")) return 1;
      if (!result.valid || !result.amount.IsZero()) {
        std::cerr << "invalid amount invalidated the link\n";
        return 1;
      }
    }

    {
      const auto result = ParseLink(base + "?amount=-5");
      if (!ExpectWarning(result, std::string(tonsentry::link::kWarningInvalidAmount),
                         "negative amount") ||
          !result.amount.IsZero()) {
        return 1;
      }
    }

    {
      const auto result = ParseLink(base + "?amount=1&amount=3000000000");
      if (!ExpectAmount(result, "3", "last amount wins")) return 1;
    }

    {
      const auto result = ParseLink(base + "?text=hello+world");
      if (!result.comment || *result.comment != "hello world") {
        std::cerr << "form-encoded comment not decoded\n";
        return 1;
      }
    }

    // Escapes that decode to control characters only at the query stage.
    {
      const auto result = ParseLink(base + "?text=%251b%255b2Jhi");
      if (!result.comment || *result.comment != "hi") {
        std::cerr << "double-encoded escape sequence kept in comment\n";
        return 1;
      }
      const auto breaks = ParseLink(base + "?text=a%250Ab%2509c%250Dd");
      if (!breaks.comment || *breaks.comment != "abcd") {
        std::cerr << "double-encoded newline or tab kept in comment\n";
        return 1;
      }
      const auto spaced = ParseLink(base + "?text=a%2520b");
      if (!spaced.comment || *spaced.comment != "a b") {
        std::cerr << "double-encoded space not decoded\n";
        return 1;
      }
    }

    {
      const std::string mirrored = "https://app.tonkeeper.com/transfer/" + kAddress +
                                   "?amount=2000000000";
      const auto result = ParseLink(mirrored);
      if (!ExpectValid(result, kAddress, "mirror link") || result.warning) return 1;
      if (!ExpectAmount(result, "2", "mirror amount")) return 1;
      const std::string clean =
          tonsentry::link::SanitizeLink(mirrored, tonsentry::config::DefaultDecoderConfig());
      if (clean != base + "?amount=2000000000") {
        std::cerr << "mirror prefix not rewritten: " << clean << "\n";
        return 1;
      }
      if (!ExpectValid(ParseLink("HTTPS://TonHub.com/transfer/" + kAddress), kAddress,
                       "mirror case-insensitive")) {
        return 1;
      }
    }

    if (!ExpectValid(ParseLink("TON://TRANSFER/" + kAddress), kAddress, "upper-case marker")) {
      return 1;
    }
    if (!ExpectValid(ParseLink("ton%3A%2F%2Ftransfer%2F" + kAddress), kAddress,
                     "percent-encoded link")) {
      return 1;
    }

    {
      const std::string split = "ton://transfer/" + kAddress.substr(0, 10) + "\n\t \x7f" +
                                kAddress.substr(10);
      const auto result = ParseLink(split);
      if (!ExpectValid(result, kAddress, "whitespace inside address") || result.warning) return 1;
    }

    {
      const auto result = ParseLink("\xff\xfe transfer/\xc3");
      if (result.valid) {
        std::cerr << "invalid utf-8 produced a valid link\n";
        return 1;
      }
      if (!ExpectWarning(result, std::string(tonsentry::link::kWarningMalformedAddress),
                         "invalid utf-8")) {
        return 1;
      }
    }

    {
      const auto json = tonsentry::link::ToJson(
          ParseLink(base + "?amount=1000000000&init=x"));
      if (json["valid"] != true || json["amount"] != "1" || json["payload_kind"] != "state_init" ||
          json["destination"] != kAddress || !json["comment"].is_null() ||
          json["stage_reached"] != "complete") {
        std::cerr << "json rendering mismatch: " << json.dump() << "\n";
        return 1;
      }
    }

    // Arbitrary input never throws and never breaks the result invariants.
    {
      const std::vector<std::string> pieces = {
          "ton://transfer/", kAddress.substr(0, 20), kAddress.substr(20), "?", "&", "=", "%",
          "%2", "amount", "text", "bin", "init", "1.5", "https://", ".", "/", "\xff", "\xd0",
          "\xe2\x80\xae", " ", "\x1b[", "0:", "-1:", "ffff", "%251b", "%250A", "%2509"};
      std::uint64_t state = 0x9e3779b97f4a7c15ULL;
      for (int round = 0; round < 2000; ++round) {
        std::string input;
        state = state * 6364136223846793005ULL + 1442695040888963407ULL;
        const int count = static_cast<int>((state >> 33) % 12);
        for (int i = 0; i < count; ++i) {
          state = state * 6364136223846793005ULL + 1442695040888963407ULL;
          input += pieces[(state >> 33) % pieces.size()];
        }
        if (!CheckInvariants(ParseLink(input))) {
          std::cerr << "invariant violated for input of size " << input.size() << "\n";
          return 1;
        }
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "link parser test threw: " << ex.what() << "\n";
    return 1;
  }

  return 0;
}

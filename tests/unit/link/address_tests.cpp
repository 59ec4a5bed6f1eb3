#include <iostream>
#include <string>

#include "link/address.hpp"

namespace {

const std::string kFriendly = "EQD4FPq-PRDieyQKkizFTRtSDyucUIqrj0v_zXJmqaDp6_0t";
const std::string kHex = "83dfd552e63729b472fcbcc8c45ebcc6691702558b68ec7527e1ba403a0f31a8";

}  // namespace

int main() {
  using namespace tonsentry::link;

  {
    AddressForm form = AddressForm::kRaw;
    if (!IsValidAddress(kFriendly, &form) || form != AddressForm::kUserFriendly) {
      std::cerr << "user-friendly address rejected\n";
      return 1;
    }
    if (!IsValidAddress("0:" + kHex, &form) || form != AddressForm::kRaw) {
      std::cerr << "raw basechain address rejected\n";
      return 1;
    }
    if (!IsValidAddress("-1:" + kHex) || !IsValidAddress("1:" + kHex)) {
      std::cerr << "raw workchain variants rejected\n";
      return 1;
    }
  }

  for (const std::string& bad :
       {std::string(), kFriendly.substr(1), kFriendly + "A", "2:" + kHex, "0:" + kHex.substr(1),
        "0:" + kHex.substr(1) + "g", std::string("???"),
        kFriendly.substr(0, 47) + "+"}) {
    if (IsValidAddress(bad)) {
      std::cerr << "accepted invalid address '" << bad << "'\n";
      return 1;
    }
  }

  {
    std::string match;
    AddressForm form = AddressForm::kRaw;
    if (!FindAddress("!!" + kFriendly + "??", &match, &form) || match != kFriendly ||
        form != AddressForm::kUserFriendly) {
      std::cerr << "embedded user-friendly address not found\n";
      return 1;
    }
    if (!FindAddress("abc:0:" + kHex, &match, &form) || match != "0:" + kHex ||
        form != AddressForm::kRaw) {
      std::cerr << "embedded raw address not found\n";
      return 1;
    }
    if (!FindAddress(kFriendly + "xyz", &match) || match != kFriendly) {
      std::cerr << "leftmost match not preferred\n";
      return 1;
    }
    if (FindAddress("???", &match) || FindAddress("", &match)) {
      std::cerr << "address found in garbage\n";
      return 1;
    }
  }

  return 0;
}

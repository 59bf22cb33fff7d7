#include "CharSets.h"

#include <array>

namespace CharSets {

const std::string letters = "etaoinshrdlcumwfgypbvkjxqz";

const std::string symbols = ".,'?!-:;@#&/()\"";

const std::string lettersAndSymbols = letters + symbols;

const std::string allPunctuation = "`~!@#$%^&*-_=+\\|;:'\",./?";

bool isValidAlphabet(const std::string& alphabet) {
  std::array<bool, 256> seen{};
  for (char c : alphabet) {
    auto idx = static_cast<unsigned char>(c);
    if (c == '\0' || seen[idx]) return false;
    seen[idx] = true;
  }
  return true;
}

} // namespace CharSets

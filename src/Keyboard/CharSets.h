#pragma once

#include <string>

// Building blocks for the active alphabet. Order matters only for
// Layout::reference(), which fills slots in alphabet order.
namespace CharSets {

// Lowercase letters, most frequent (English) first
extern const std::string letters;

// Punctuation that fits next to the letters on the 9 keys
extern const std::string symbols;

// letters + symbols
extern const std::string lettersAndSymbols;

// Every printable ASCII symbol a 6-column swipe layout carries.
// Larger than the 9-key capacity when combined with letters.
extern const std::string allPunctuation;

// True if every character appears at most once and none is NUL.
bool isValidAlphabet(const std::string& alphabet);

} // namespace CharSets

#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>

// -----------------------------------------------------------------------------
// Frequency tables over the active character set.
// -----------------------------------------------------------------------------
//
// Counts or probabilities, both are fine: the cost model normalizes. Entries for
// characters outside the alphabet are ignored and missing entries count as zero.
//
// starts[c] counts keystrokes of c with no preceding alphabet character
// (start of text, or right after a space/newline/unknown symbol). Those are
// typed from the resting point rather than from a previous key.
//
// -----------------------------------------------------------------------------

struct CorpusStats {
  using Bigram = std::pair<char, char>;

  std::unordered_map<char, double> unigrams;
  std::map<Bigram, double> bigrams;
  std::unordered_map<char, double> starts;

  // Tokenize text against the alphabet and add its counts.
  // Uppercase letters fold to lowercase when only the lowercase is in the alphabet.
  // Any character outside the alphabet breaks the chain.
  void addText(std::string_view text, const std::string& alphabet);

  static CorpusStats fromText(std::string_view text, const std::string& alphabet);

  // Throws std::runtime_error if the file cannot be read.
  static CorpusStats load(const std::filesystem::path& path, const std::string& alphabet);

  double unigram(char c) const;
  double bigram(char a, char b) const;
  double start(char c) const;

  bool empty() const { return unigrams.empty() && bigrams.empty() && starts.empty(); }
};

#include "CorpusStats.h"

#include <array>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "Utils/Debug.h"

using namespace std;

void CorpusStats::addText(string_view text, const string& alphabet) {
  array<bool, 256> known{};
  for (char c : alphabet) known[static_cast<unsigned char>(c)] = true;

  auto normalize = [&](char c) -> char {
    if (known[static_cast<unsigned char>(c)]) return c;
    char lower = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    if (lower != c && known[static_cast<unsigned char>(lower)]) return lower;
    return '\0';
  };

  char prev = '\0';
  size_t skipped = 0;
  for (char raw : text) {
    char c = normalize(raw);
    if (c == '\0') {
      if (!isspace(static_cast<unsigned char>(raw))) skipped++;
      prev = '\0';
      continue;
    }
    unigrams[c] += 1.0;
    if (prev == '\0') {
      starts[c] += 1.0;
    } else {
      bigrams[{prev, c}] += 1.0;
    }
    prev = c;
  }

  debug("corpus: added", text.size(), "bytes,", skipped, "non-alphabet symbols skipped");
}

CorpusStats CorpusStats::fromText(string_view text, const string& alphabet) {
  CorpusStats stats;
  stats.addText(text, alphabet);
  return stats;
}

CorpusStats CorpusStats::load(const filesystem::path& path, const string& alphabet) {
  ifstream file(path, ios::binary);
  if (!file) {
    throw runtime_error("Cannot open corpus: " + path.string());
  }
  ostringstream contents;
  contents << file.rdbuf();
  if (file.bad()) {
    throw runtime_error("Error while reading corpus: " + path.string());
  }
  return fromText(contents.str(), alphabet);
}

double CorpusStats::unigram(char c) const {
  auto it = unigrams.find(c);
  return it == unigrams.end() ? 0.0 : it->second;
}

double CorpusStats::bigram(char a, char b) const {
  auto it = bigrams.find({a, b});
  return it == bigrams.end() ? 0.0 : it->second;
}

double CorpusStats::start(char c) const {
  auto it = starts.find(c);
  return it == starts.end() ? 0.0 : it->second;
}

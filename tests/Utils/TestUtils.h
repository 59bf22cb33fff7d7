#pragma once

#include "Corpus/CorpusStats.h"
#include "Cost/CostBreakdown.h"
#include "Keyboard/KeyboardModel.h"
#include "Layout/Layout.h"
#include "Optimizer/Config.h"

#include <bits/stdc++.h>
using namespace std;

struct Placement {
  char c;
  SlotId slot;
  Placement(char c, Key k, Role r) : c(c), slot(makeSlot(k, r)) {}
};

namespace TestFiles {

inline std::string load(const std::string& filename) {
    auto path = std::filesystem::path(TESTFILES_DIR) / filename;
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open: " + path.string());
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

inline std::filesystem::path path(const std::string& filename) {
    return std::filesystem::path(TESTFILES_DIR) / filename;
}

}

// Place every character explicitly; throws LayoutError like Layout::place.
Layout makeLayout(const Config& config, initializer_list<Placement> placements);

// Corpus with a single bigram and nothing else.
CorpusStats bigramOnly(char a, char b, double weight = 1.0);

// Per-character base attributions then per-pair penalties, in stored order.
double sumOfParts(const CostBreakdown& b);

// Every alphabet character in exactly one available slot, every slot at most one.
bool isBijection(const Layout& layout);

vector<SlotId> availableSlots(const Layout& layout);

#pragma once

#include <ostream>
#include <string>
#include <vector>

struct CharCost {
  char c;
  double cost;
  CharCost(char c, double cost) : c(c), cost(cost) {}
};

struct PairPenalty {
  char a;
  char b;
  double cost;
  PairPenalty(char a, char b, double cost) : a(a), b(b), cost(cost) {}
};

// Diagnostics only; the search uses the scalar total.
// base, swipePenalty and total are summed from the attributions below in
// order, so total == sum(baseByChar) + sum(penaltyByPair) holds exactly.
struct CostBreakdown {
  double total = 0.0;
  double base = 0.0;
  double swipePenalty = 0.0;

  std::vector<CharCost> baseByChar;       // alphabet order
  std::vector<PairPenalty> penaltyByPair; // only pairs with a nonzero penalty

  std::string to_string() const;

  friend std::ostream& operator<<(std::ostream& os, const CostBreakdown& b);
};

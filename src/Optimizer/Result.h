#pragma once

#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "Cost/CostBreakdown.h"
#include "Layout/Layout.h"
#include "TopLayouts.h"

struct AnnealStats {
  long long iterations = 0;
  long long accepted = 0;
  long long improvedBest = 0;
  double finalTemperature = 0.0;
};

// Best layout of a run, scored by a full evaluation.
struct AnnealResult {
  Layout best;
  CostBreakdown breakdown;
  AnnealStats stats;
  int chain = 0;

  // Cheapest distinct layouts visited, exact totals, cheapest first. Holds at
  // most AnnealParams::keepTop entries; the first one costs the same as best.
  std::vector<RankedLayout> top;

  AnnealResult(Layout layout, CostBreakdown b, AnnealStats s, int chain = 0)
      : best(std::move(layout)), breakdown(std::move(b)), stats(s), chain(chain) {}

  double cost() const { return breakdown.total; }

  std::string to_string() const {
    std::ostringstream oss;
    oss << *this;
    return oss.str();
  }

  friend std::ostream& operator<<(std::ostream& os, const AnnealResult& r) {
    os << r.best;
    os << r.breakdown;
    os << "iterations: " << r.stats.iterations << "  accepted: " << r.stats.accepted
       << "  new bests: " << r.stats.improvedBest << "  final T: " << r.stats.finalTemperature << '\n';
    return os;
  }
};

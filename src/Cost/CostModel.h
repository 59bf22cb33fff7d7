#pragma once

#include <array>
#include <vector>

#include "CostBreakdown.h"
#include "Corpus/CorpusStats.h"
#include "Keyboard/KeyboardModel.h"
#include "Layout/Layout.h"
#include "Optimizer/Config.h"

// -----------------------------------------------------------------------------
// Expected typing time of a layout over a corpus.
// -----------------------------------------------------------------------------
//
// base    = sum_{c1,c2} w(c1,c2) * keystroke(endpoint(c1) -> c2)
//         + sum_{c}     s(c)     * keystroke(restPoint   -> c)
// penalty = sum_{swipe pairs a<b} scale * relation(key(a), key(b)) * combine(p(a), p(b))
//
// w and s are bigram and run-start counts normalized by their joint total, so
// base is the expected movement time per keystroke. p is the normalized unigram
// frequency. A keystroke to a swipe slot is two chained Fitts movements (to the
// key center, then the swipe extension) plus the gesture constant.
//
// Everything that depends only on geometry is tabulated per slot at
// construction; evaluation is table lookups over the alphabet.
//
// -----------------------------------------------------------------------------

class CostModel {
public:
  // Validates config (ConfigError). The corpus is copied into dense tables.
  CostModel(const Config& config, const CorpusStats& corpus);

  const Config& config() const { return config_; }

  // a + b * log2(d / w + 1), d clamped at 0.
  double fitts(double distance, double width) const;

  // Where the thumb ends after typing slot s.
  Vec2 endpoint(SlotId s) const;

  // Time to type slot s starting from point p.
  double keystrokeCost(const Vec2& p, SlotId s) const;

  // Time to type slot s from the resting point.
  double isolatedCost(SlotId s) const { return isolated_[s]; }

  // Time to type slot b right after slot a.
  double transitionCost(SlotId a, SlotId b) const { return transition_[a][b]; }

  // Structural weight of a pair of slots (0 unless both are swipes on related keys).
  double swipePairWeight(SlotId a, SlotId b) const { return pairWeight_[a][b]; }

  // Normalized corpus weights by alphabet index
  double bigramWeight(int i, int j) const { return bigram_[i * n_ + j]; }
  double startWeight(int i) const { return start_[i]; }
  double unigramWeight(int i) const { return unigram_[i]; }

  // Throws LayoutError if the layout does not belong to this model's config.
  void checkLayout(const Layout& layout) const;

  CostBreakdown evaluate(const Layout& layout) const;

  // Same value as evaluate(layout).total, without building the attribution.
  double total(const Layout& layout) const;

  // total(after swapSlots(a, b)) - total(layout), touching only the moved characters.
  double swapDelta(const Layout& layout, SlotId a, SlotId b) const;

private:
  Config config_;
  int n_;

  std::vector<double> bigram_;
  std::vector<double> start_;
  std::vector<double> unigram_;

  std::array<double, SLOT_COUNT> isolated_{};
  std::array<std::array<double, SLOT_COUNT>, SLOT_COUNT> transition_{};
  std::array<std::array<double, SLOT_COUNT>, SLOT_COUNT> pairWeight_{};

  void buildFrequencyTables(const CorpusStats& corpus);
  void buildSlotTables();

  // All base terms whose typed character is j.
  double charBaseCost(const Layout& layout, int j) const;
  double pairPenalty(const Layout& layout, int i, int j) const;

  // Sum of every term involving character t1 or t2 (-1 for none).
  double touchedCost(const Layout& layout, int t1, int t2) const;
};

#include "CostModel.h"

#include <cmath>

#include "Utils/Debug.h"
#include "Utils/Errors.h"

using namespace std;

// Malformed entries (negative, NaN, infinite) count as zero.
static double sanitize(double count) {
  return (count > 0.0 && isfinite(count)) ? count : 0.0;
}

CostModel::CostModel(const Config& config, const CorpusStats& corpus)
    : config_(config), n_(static_cast<int>(config.alphabet.size())) {
  config_.validate();
  buildFrequencyTables(corpus);
  buildSlotTables();
}

void CostModel::buildFrequencyTables(const CorpusStats& corpus) {
  const string& alphabet = config_.alphabet;
  array<int, 256> index;
  index.fill(-1);
  for (int i = 0; i < n_; i++) index[static_cast<unsigned char>(alphabet[i])] = i;
  auto indexOf = [&](char c) { return index[static_cast<unsigned char>(c)]; };

  bigram_.assign(static_cast<size_t>(n_) * n_, 0.0);
  start_.assign(n_, 0.0);
  unigram_.assign(n_, 0.0);

  int ignored = 0;
  for (const auto& [bg, count] : corpus.bigrams) {
    int i = indexOf(bg.first), j = indexOf(bg.second);
    if (i < 0 || j < 0) { ignored++; continue; }
    bigram_[i * n_ + j] += sanitize(count);
  }
  for (const auto& [c, count] : corpus.starts) {
    int i = indexOf(c);
    if (i < 0) { ignored++; continue; }
    start_[i] += sanitize(count);
  }
  for (const auto& [c, count] : corpus.unigrams) {
    int i = indexOf(c);
    if (i < 0) { ignored++; continue; }
    unigram_[i] += sanitize(count);
  }
  if (ignored > 0) {
    debug("cost model: ignored", ignored, "corpus entries outside the alphabet");
  }

  double transitions = 0.0;
  for (double w : bigram_) transitions += w;
  for (double w : start_) transitions += w;
  if (transitions > 0.0) {
    for (double& w : bigram_) w /= transitions;
    for (double& w : start_) w /= transitions;
  }

  double characters = 0.0;
  for (double w : unigram_) characters += w;
  if (characters > 0.0) {
    for (double& w : unigram_) w /= characters;
  }
}

void CostModel::buildSlotTables() {
  const SwipePenaltyWeights& adj = config_.weights.adjacency;
  for (SlotId a = 0; a < SLOT_COUNT; a++) {
    isolated_[a] = keystrokeCost(config_.restPoint, a);
    Vec2 from = endpoint(a);
    for (SlotId b = 0; b < SLOT_COUNT; b++) {
      transition_[a][b] = keystrokeCost(from, b);
      pairWeight_[a][b] = 0.0;
      if (a != b && isSwipeSlot(a) && isSwipeSlot(b)) {
        pairWeight_[a][b] = adj.w_scale * adj.relationWeight(keyRelation(slotKey(a), slotKey(b)));
      }
    }
  }
}

double CostModel::fitts(double distance, double width) const {
  const CostWeights& w = config_.weights;
  double d = distance > 0.0 ? distance : 0.0;
  return w.fitts_a + w.fitts_b * log2(d / width + 1.0);
}

Vec2 CostModel::endpoint(SlotId s) const {
  const KeyInfo& key = config_.keyInfo[static_cast<int>(slotKey(s))];
  return key.center + swipeDirection(slotRole(s)) * config_.weights.swipe_distance;
}

double CostModel::keystrokeCost(const Vec2& p, SlotId s) const {
  const KeyInfo& key = config_.keyInfo[static_cast<int>(slotKey(s))];
  double t = fitts(distance(p, key.center), key.width);
  if (isSwipeSlot(s)) {
    t += fitts(config_.weights.swipe_distance, key.width) + config_.weights.swipe_constant;
  }
  return t;
}

void CostModel::checkLayout(const Layout& layout) const {
  if (!layout.compatibleWith(config_)) {
    throw LayoutError("layout alphabet or available slots do not match the cost model configuration");
  }
  layout.validate();
}

double CostModel::charBaseCost(const Layout& layout, int j) const {
  SlotId target = layout.slotOfIndex(j);
  double acc = start_[j] * isolated_[target];
  for (int i = 0; i < n_; i++) {
    double w = bigram_[i * n_ + j];
    if (w == 0.0) continue;
    acc += w * transition_[layout.slotOfIndex(i)][target];
  }
  return acc;
}

double CostModel::pairPenalty(const Layout& layout, int i, int j) const {
  double weight = pairWeight_[layout.slotOfIndex(i)][layout.slotOfIndex(j)];
  if (weight == 0.0) return 0.0;
  return weight * config_.weights.adjacency.combineFrequencies(unigram_[i], unigram_[j]);
}

CostBreakdown CostModel::evaluate(const Layout& layout) const {
  checkLayout(layout);

  CostBreakdown b;
  b.baseByChar.reserve(n_);
  for (int j = 0; j < n_; j++) {
    double cost = charBaseCost(layout, j);
    b.baseByChar.emplace_back(config_.alphabet[j], cost);
    b.base += cost;
  }
  for (int i = 0; i < n_; i++) {
    for (int j = i + 1; j < n_; j++) {
      double cost = pairPenalty(layout, i, j);
      if (cost == 0.0) continue;
      b.penaltyByPair.emplace_back(config_.alphabet[i], config_.alphabet[j], cost);
      b.swipePenalty += cost;
    }
  }
  b.total = b.base + b.swipePenalty;
  return b;
}

double CostModel::total(const Layout& layout) const {
  double base = 0.0;
  for (int j = 0; j < n_; j++) {
    base += charBaseCost(layout, j);
  }
  double penalty = 0.0;
  for (int i = 0; i < n_; i++) {
    for (int j = i + 1; j < n_; j++) {
      double cost = pairPenalty(layout, i, j);
      if (cost == 0.0) continue;
      penalty += cost;
    }
  }
  return base + penalty;
}

double CostModel::touchedCost(const Layout& layout, int t1, int t2) const {
  auto touched = [&](int k) { return k == t1 || k == t2; };

  double acc = 0.0;
  for (int t : {t1, t2}) {
    if (t < 0) continue;
    // Incoming terms and the run-start term of t
    acc += charBaseCost(layout, t);
    // Outgoing terms of t into untouched characters
    SlotId from = layout.slotOfIndex(t);
    for (int j = 0; j < n_; j++) {
      if (touched(j)) continue;
      double w = bigram_[t * n_ + j];
      if (w == 0.0) continue;
      acc += w * transition_[from][layout.slotOfIndex(j)];
    }
    for (int k = 0; k < n_; k++) {
      if (touched(k)) continue;
      acc += pairPenalty(layout, t, k);
    }
  }
  if (t1 >= 0 && t2 >= 0) {
    acc += pairPenalty(layout, t1, t2);
  }
  return acc;
}

double CostModel::swapDelta(const Layout& layout, SlotId a, SlotId b) const {
  int ia = layout.indexAt(a);
  int ib = layout.indexAt(b);
  if (a == b || (ia < 0 && ib < 0)) return 0.0;

  double before = touchedCost(layout, ia, ib);
  Layout after = layout;
  after.swapSlots(a, b);
  return touchedCost(after, ia, ib) - before;
}

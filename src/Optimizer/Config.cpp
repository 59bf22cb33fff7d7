#include "Config.h"

#include <bits/stdc++.h>

#include "Keyboard/CharSets.h"
#include "Utils/Errors.h"

using namespace std;

void fillGrid(Config& cfg);

Config Config::lettersOnly() {
  Config c;
  fillGrid(c);
  c.alphabet = CharSets::letters;
  c.centerKeySwipes = false;
  return c;
}

Config Config::lettersAndSymbols() {
  Config c;
  fillGrid(c);
  c.alphabet = CharSets::lettersAndSymbols;
  c.centerKeySwipes = true;
  return c;
}

/*
* Unit Fitts slope, no intercept, no gesture constant, no adjacency penalty.
* Movement times reduce to log2(d / w + 1) for hand-computed tests.
*/
Config Config::uniform() {
  Config c;
  fillGrid(c);
  c.alphabet = CharSets::letters;
  c.weights = CostWeights();
  c.weights.fitts_a = 0.0;
  c.weights.fitts_b = 1.0;
  c.weights.swipe_constant = 0.0;
  c.weights.adjacency.w_scale = 0.0;
  return c;
}

// ---------------------------------------------------------------------------
// 3x3 grid, unit pitch, keys touching edge to edge:
//
//   (0,0) (1,0) (2,0)
//   (0,1) (1,1) (2,1)
//   (0,2) (1,2) (2,2)
//         [space]        rest point (1,3)
// ---------------------------------------------------------------------------
void fillGrid(Config& cfg) {
  for (int k = 0; k < KEY_COUNT; k++) {
    Key key = static_cast<Key>(k);
    cfg.keyInfo[k] = KeyInfo(Vec2(keyCol(key), keyRow(key)), 1.0);
  }
  cfg.restPoint = Vec2(1.0, 3.0);
}

double SwipePenaltyWeights::relationWeight(KeyRelation rel) const {
  switch (rel) {
    case KeyRelation::SameKey:        return w_same_key;
    case KeyRelation::SideNeighbor:   return w_side_neighbor;
    case KeyRelation::CornerNeighbor: return w_corner_neighbor;
    default:                          return 0.0;
  }
}

double SwipePenaltyWeights::combineFrequencies(double pa, double pb) const {
  return combine == Combine::Product ? pa * pb : pa + pb;
}

bool Config::isAvailable(SlotId s) const {
  if (s < 0 || s >= SLOT_COUNT) return false;
  if (slotKey(s) == Key::Key_Center && isSwipeSlot(s)) {
    return centerKeySwipes;
  }
  return true;
}

int Config::capacity() const {
  int n = 0;
  for (SlotId s = 0; s < SLOT_COUNT; s++) {
    if (isAvailable(s)) n++;
  }
  return n;
}

static void requireNonNegative(double v, const string& name) {
  if (!(v >= 0.0) || !isfinite(v)) {
    throw ConfigError(name + " must be a finite non-negative number, got " + to_string(v));
  }
}

void Config::validate() const {
  if (!CharSets::isValidAlphabet(alphabet)) {
    throw ConfigError("alphabet contains duplicate or NUL characters");
  }
  if (static_cast<int>(alphabet.size()) > capacity()) {
    throw ConfigError("alphabet of " + to_string(alphabet.size()) +
                      " characters exceeds layout capacity of " + to_string(capacity()) + " slots");
  }
  for (int k = 0; k < KEY_COUNT; k++) {
    const KeyInfo& ki = keyInfo[k];
    if (!(ki.width > 0.0) || !isfinite(ki.width)) {
      throw ConfigError(string("key ") + keyName(static_cast<Key>(k)) + " must have a positive width");
    }
    if (!isfinite(ki.center.x) || !isfinite(ki.center.y)) {
      throw ConfigError(string("key ") + keyName(static_cast<Key>(k)) + " has a non-finite center");
    }
  }
  requireNonNegative(weights.fitts_a, "fitts_a");
  requireNonNegative(weights.fitts_b, "fitts_b");
  requireNonNegative(weights.swipe_distance, "swipe_distance");
  requireNonNegative(weights.swipe_constant, "swipe_constant");

  const SwipePenaltyWeights& adj = weights.adjacency;
  requireNonNegative(adj.w_scale, "w_scale");
  requireNonNegative(adj.w_same_key, "w_same_key");
  requireNonNegative(adj.w_side_neighbor, "w_side_neighbor");
  requireNonNegative(adj.w_corner_neighbor, "w_corner_neighbor");

  debug("config ok:", alphabet.size(), "characters,", capacity(), "slots");
}

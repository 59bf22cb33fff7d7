#pragma once
#include <array>
#include <string>

#include "Keyboard/KeyboardModel.h"
#include "Utils/Debug.h"

// -----------------------------------------------------------------------------
// Key metadata and weights
// -----------------------------------------------------------------------------

struct KeyInfo {
  Vec2 center{};
  double width = 1.0;

  KeyInfo() = default;
  KeyInfo(Vec2 c, double w) : center(c), width(w) {}
};

// How two swipe characters on related keys are charged.
// penalty = w_scale * relationWeight(rel) * combine(p(a), p(b)),
// with p the normalized unigram frequency.
struct SwipePenaltyWeights final {
  enum class Combine { Product, Sum };

  double w_scale           = 20.0;
  double w_same_key        = 1.0;
  double w_side_neighbor   = 0.5;
  double w_corner_neighbor = 0.25;
  Combine combine          = Combine::Product;

  double relationWeight(KeyRelation rel) const;
  double combineFrequencies(double pa, double pb) const;
};

// Movement-time constants. Distances are in key units (key pitch = 1).
struct CostWeights final {
  double fitts_a        = 0.083; // intercept, seconds
  double fitts_b        = 0.127; // seconds per bit
  double swipe_distance = 0.6;   // length of the directional extension
  double swipe_constant = 0.05;  // gesture overhead vs a tap

  SwipePenaltyWeights adjacency{};
};

// Use factory pattern
struct Config {
  std::array<KeyInfo, KEY_COUNT> keyInfo{};

  CostWeights weights{};

  // Every character that must be placed. Order is the fill order of Layout::reference().
  std::string alphabet;

  // Where the thumb starts a run of characters (the space bar, below the grid).
  Vec2 restPoint{1.0, 3.0};

  // The center key holds a tap character only unless enabled.
  bool centerKeySwipes = true;

  static Config lettersOnly();
  static Config lettersAndSymbols();
  static Config uniform();

  bool isAvailable(SlotId s) const;
  int capacity() const;

  // Throws ConfigError. Called before any evaluation or search.
  void validate() const;

private:
  Config() = default;
};

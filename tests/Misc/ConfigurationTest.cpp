#include <gtest/gtest.h>

#include "Corpus/CorpusStats.h"
#include "Cost/CostModel.h"
#include "Keyboard/CharSets.h"
#include "Layout/Layout.h"
#include "Optimizer/AnnealParams.h"
#include "Optimizer/Config.h"
#include "Utils/TestUtils.h"

using namespace std;

// =============================================================================
// Presets
// =============================================================================

TEST(ConfigurationTest, LettersOnlyKeepsCenterKeyTapOnly) {
  Config cfg = Config::lettersOnly();
  EXPECT_EQ(cfg.alphabet, CharSets::letters);
  EXPECT_FALSE(cfg.centerKeySwipes);
  EXPECT_EQ(cfg.capacity(), SLOT_COUNT - 4);
  EXPECT_TRUE(cfg.isAvailable(makeSlot(Key::Key_Center, Role::Tap)));
  EXPECT_FALSE(cfg.isAvailable(makeSlot(Key::Key_Center, Role::SwipeUp)));
  EXPECT_NO_THROW(cfg.validate());
}

TEST(ConfigurationTest, LettersAndSymbolsUsesEveryKey) {
  Config cfg = Config::lettersAndSymbols();
  EXPECT_EQ(cfg.alphabet, CharSets::letters + CharSets::symbols);
  EXPECT_TRUE(cfg.centerKeySwipes);
  EXPECT_EQ(cfg.capacity(), SLOT_COUNT);
  EXPECT_LE(static_cast<int>(cfg.alphabet.size()), cfg.capacity());
  EXPECT_NO_THROW(cfg.validate());
}

TEST(ConfigurationTest, UniformHasPureLogMovement) {
  Config cfg = Config::uniform();
  EXPECT_DOUBLE_EQ(cfg.weights.fitts_a, 0.0);
  EXPECT_DOUBLE_EQ(cfg.weights.fitts_b, 1.0);
  EXPECT_DOUBLE_EQ(cfg.weights.swipe_constant, 0.0);
  EXPECT_DOUBLE_EQ(cfg.weights.adjacency.w_scale, 0.0);
}

TEST(ConfigurationTest, GridGeometry) {
  Config cfg = Config::lettersOnly();
  const KeyInfo& center = cfg.keyInfo[static_cast<size_t>(Key::Key_Center)];
  const KeyInfo& bottomRight = cfg.keyInfo[static_cast<size_t>(Key::Key_BottomRight)];
  EXPECT_DOUBLE_EQ(center.center.x, 1.0);
  EXPECT_DOUBLE_EQ(center.center.y, 1.0);
  EXPECT_DOUBLE_EQ(bottomRight.center.x, 2.0);
  EXPECT_DOUBLE_EQ(bottomRight.center.y, 2.0);
  for (const KeyInfo& ki : cfg.keyInfo) {
    EXPECT_DOUBLE_EQ(ki.width, 1.0);
  }
}

TEST(ConfigurationTest, AdjacencyWeightsByRelation) {
  SwipePenaltyWeights w;
  EXPECT_DOUBLE_EQ(w.relationWeight(KeyRelation::SameKey), 1.0);
  EXPECT_DOUBLE_EQ(w.relationWeight(KeyRelation::SideNeighbor), 0.5);
  EXPECT_DOUBLE_EQ(w.relationWeight(KeyRelation::CornerNeighbor), 0.25);
  EXPECT_DOUBLE_EQ(w.relationWeight(KeyRelation::Unrelated), 0.0);

  EXPECT_DOUBLE_EQ(w.combineFrequencies(0.2, 0.3), 0.06);
  w.combine = SwipePenaltyWeights::Combine::Sum;
  EXPECT_DOUBLE_EQ(w.combineFrequencies(0.2, 0.3), 0.5);
}

// =============================================================================
// Configuration drives the cost
// =============================================================================

TEST(ConfigurationTest, WiderKeysAreCheaper) {
  Config narrow = Config::lettersOnly();
  Config wide = Config::lettersOnly();
  for (KeyInfo& ki : wide.keyInfo) ki.width = 1.5;

  CorpusStats stats = CorpusStats::fromText(TestFiles::load("pangrams.txt"), narrow.alphabet);
  Layout layout = Layout::reference(narrow);

  EXPECT_LT(CostModel(wide, stats).total(layout), CostModel(narrow, stats).total(layout));
}

TEST(ConfigurationTest, AdjacencyScaleOnlyMovesPenaltyBucket) {
  Config cfg = Config::lettersOnly();
  Config doubled = cfg;
  doubled.weights.adjacency.w_scale *= 2.0;

  CorpusStats stats = CorpusStats::fromText(TestFiles::load("pangrams.txt"), cfg.alphabet);
  Layout layout = Layout::reference(cfg);

  CostBreakdown b1 = CostModel(cfg, stats).evaluate(layout);
  CostBreakdown b2 = CostModel(doubled, stats).evaluate(layout);
  EXPECT_DOUBLE_EQ(b1.base, b2.base);
  EXPECT_NEAR(b2.swipePenalty, 2.0 * b1.swipePenalty, 1e-12);
}

TEST(ConfigurationTest, EnablingCenterSwipesAddsCapacity) {
  Config cfg = Config::lettersOnly();
  cfg.alphabet = CharSets::letters + "0123456789.,'?!";  // 41 characters
  EXPECT_NO_THROW(cfg.validate());

  cfg.alphabet += "-";
  EXPECT_ANY_THROW(cfg.validate());

  cfg.centerKeySwipes = true;
  EXPECT_NO_THROW(cfg.validate());
}

// =============================================================================
// Annealing parameters
// =============================================================================

TEST(ConfigurationTest, AnnealParamsDefaultsAndMerge) {
  AnnealParams defaults;
  EXPECT_NO_THROW(defaults.validate());
  EXPECT_GT(defaults.initialTemperature, 0.0);
  EXPECT_LT(defaults.coolingRate, 1.0);

  AnnealParams custom(500, 2.0, 0.9, 5);
  EXPECT_EQ(custom.maxIterations, 500);
  EXPECT_DOUBLE_EQ(custom.initialTemperature, 2.0);
  EXPECT_DOUBLE_EQ(custom.coolingRate, 0.9);
  EXPECT_EQ(custom.iterationsPerTemperature, 5);

  EXPECT_EQ(AnnealParams::merge(defaults, nullopt).maxIterations, defaults.maxIterations);
  EXPECT_EQ(AnnealParams::merge(defaults, custom).maxIterations, 500);
}

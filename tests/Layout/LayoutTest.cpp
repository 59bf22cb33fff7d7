#include <gtest/gtest.h>

#include "Keyboard/CharSets.h"
#include "Layout/Layout.h"
#include "Optimizer/Config.h"
#include "Utils/Errors.h"
#include "Utils/TestUtils.h"

using namespace std;

static const string LETTERS_REFERENCE =
    "nmk__ tdyz_ swj__ alp__ e____ ocb__ hfx__ iuv__ rgq__";

TEST(LayoutTest, ReferenceIsBijection) {
  for (const Config& cfg : {Config::lettersOnly(), Config::lettersAndSymbols()}) {
    Layout layout = Layout::reference(cfg);
    EXPECT_NO_THROW(layout.validate());
    EXPECT_TRUE(isBijection(layout));
    EXPECT_EQ(layout.size(), static_cast<int>(cfg.alphabet.size()));
    for (char c : cfg.alphabet) {
      EXPECT_TRUE(layout.isAvailable(layout.slotOf(c))) << c;
    }
  }
}

TEST(LayoutTest, ReferenceFillsTapsBeforeSwipes) {
  Layout layout = Layout::reference(Config::lettersOnly());
  EXPECT_EQ(layout.serialize(), LETTERS_REFERENCE);
  EXPECT_EQ(layout.slotOf('e'), makeSlot(Key::Key_Center, Role::Tap));
  EXPECT_EQ(layout.slotOf('t'), makeSlot(Key::Key_Top, Role::Tap));
  EXPECT_EQ(layout.slotOf('d'), makeSlot(Key::Key_Top, Role::SwipeUp));

  // With center swipes enabled the first swipe character goes to the center
  Layout withSymbols = Layout::reference(Config::lettersAndSymbols());
  EXPECT_EQ(withSymbols.slotOf('d'), makeSlot(Key::Key_Center, Role::SwipeUp));
}

TEST(LayoutTest, CenterKeyIsTapOnlyWhenSwipesDisabled) {
  Config cfg = Config::lettersOnly();
  Layout layout = Layout::reference(cfg);
  for (Role r : {Role::SwipeUp, Role::SwipeDown, Role::SwipeLeft, Role::SwipeRight}) {
    SlotId s = makeSlot(Key::Key_Center, r);
    EXPECT_FALSE(layout.isAvailable(s));
    EXPECT_EQ(layout.charAt(s), '\0');
  }
}

TEST(LayoutTest, EverySwapKeepsBijection) {
  Layout original = Layout::reference(Config::lettersOnly());
  vector<SlotId> slots = availableSlots(original);
  for (SlotId a : slots) {
    for (SlotId b : slots) {
      Layout layout = original;
      layout.swapSlots(a, b);
      ASSERT_TRUE(isBijection(layout)) << slotName(a) << " <-> " << slotName(b);
      ASSERT_NO_THROW(layout.validate());
      layout.swapSlots(a, b);
      ASSERT_EQ(layout, original);
    }
  }
}

TEST(LayoutTest, SwapMovesCharacterIntoEmptySlot) {
  Layout layout = Layout::reference(Config::lettersOnly());
  SlotId from = layout.slotOf('z');
  SlotId empty = makeSlot(Key::Key_BottomRight, Role::SwipeRight);
  ASSERT_FALSE(layout.isOccupied(empty));

  layout.swapSlots(from, empty);
  EXPECT_EQ(layout.slotOf('z'), empty);
  EXPECT_EQ(layout.charAt(empty), 'z');
  EXPECT_FALSE(layout.isOccupied(from));
  EXPECT_TRUE(isBijection(layout));
}

TEST(LayoutTest, SwapWithUnavailableSlotThrows) {
  Layout layout = Layout::reference(Config::lettersOnly());
  EXPECT_THROW(layout.swapSlots(layout.slotOf('e'), makeSlot(Key::Key_Center, Role::SwipeUp)),
               LayoutError);
}

TEST(LayoutTest, ParseSerializeRoundTrip) {
  Config cfg = Config::lettersOnly();
  Layout parsed = Layout::parse(cfg, LETTERS_REFERENCE);
  EXPECT_EQ(parsed, Layout::reference(cfg));
  EXPECT_EQ(parsed.serialize(), LETTERS_REFERENCE);
}

TEST(LayoutTest, ParseRejectsBrokenLayouts) {
  Config cfg = Config::lettersOnly();

  // 'n' twice, 'r' missing
  EXPECT_THROW(Layout::parse(cfg, "nmk__ tdyz_ swj__ alp__ e____ ocb__ hfx__ iuv__ ngq__"),
               LayoutError);
  // unknown character
  EXPECT_THROW(Layout::parse(cfg, "nmk__ tdyz_ swj__ alp__ e____ ocb__ hfx__ iuv__ rgq_1"),
               LayoutError);
  // 'q' missing
  EXPECT_THROW(Layout::parse(cfg, "nmk__ tdyz_ swj__ alp__ e____ ocb__ hfx__ iuv__ rg___"),
               LayoutError);
  // swipe on the tap-only center key
  EXPECT_THROW(Layout::parse(cfg, "nmk__ tdy__ swj__ alp__ ez___ ocb__ hfx__ iuv__ rgq__"),
               LayoutError);
  // too few groups
  EXPECT_THROW(Layout::parse(cfg, "nmk__ tdyz_ swj__ alp__ e____ ocb__ hfx__ iuv__"), LayoutError);
  // too many groups
  EXPECT_THROW(Layout::parse(cfg, LETTERS_REFERENCE + " _____"), LayoutError);
  // group of the wrong width
  EXPECT_THROW(Layout::parse(cfg, "nmk_ tdyz_ swj__ alp__ e____ ocb__ hfx__ iuv__ rgq__"),
               LayoutError);
}

TEST(LayoutTest, PlaceRejectsConflicts) {
  Config cfg = Config::lettersOnly();
  Layout layout(cfg);
  layout.place('e', makeSlot(Key::Key_Center, Role::Tap));

  EXPECT_THROW(layout.place('e', makeSlot(Key::Key_Top, Role::Tap)), LayoutError);
  EXPECT_THROW(layout.place('t', makeSlot(Key::Key_Center, Role::Tap)), LayoutError);
  EXPECT_THROW(layout.place('7', makeSlot(Key::Key_Top, Role::Tap)), LayoutError);
  EXPECT_THROW(layout.place('t', makeSlot(Key::Key_Center, Role::SwipeDown)), LayoutError);

  // Incomplete layouts fail validation
  EXPECT_THROW(layout.validate(), LayoutError);
}

TEST(LayoutTest, RandomIsSeededBijection) {
  Config cfg = Config::lettersAndSymbols();
  mt19937_64 rng1(7), rng2(7);
  Layout a = Layout::random(cfg, rng1);
  Layout b = Layout::random(cfg, rng2);
  EXPECT_TRUE(isBijection(a));
  EXPECT_NO_THROW(a.validate());
  EXPECT_EQ(a, b);
}

TEST(LayoutTest, CompatibilityFollowsConfig) {
  Layout layout = Layout::reference(Config::lettersOnly());
  EXPECT_TRUE(layout.compatibleWith(Config::lettersOnly()));
  EXPECT_FALSE(layout.compatibleWith(Config::lettersAndSymbols()));

  Config centerSwipes = Config::lettersOnly();
  centerSwipes.centerKeySwipes = true;
  EXPECT_FALSE(layout.compatibleWith(centerSwipes));
}

TEST(LayoutTest, PrintsThreeByThreeGrid) {
  ostringstream oss;
  oss << Layout::reference(Config::lettersOnly());
  string text = oss.str();

  EXPECT_EQ(count(text.begin(), text.end(), '\n'), 11);
  // Top row, middle line: TopLeft has 'n' tapped, Top has 'z' on the left and 't' tapped
  EXPECT_NE(text.find("   n   | z t   |"), string::npos) << text;
  EXPECT_NE(text.find("-------+-------+-------"), string::npos);
}

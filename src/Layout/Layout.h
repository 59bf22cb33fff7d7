#pragma once

#include <array>
#include <ostream>
#include <random>
#include <string>
#include <vector>

#include "Keyboard/KeyboardModel.h"
#include "Optimizer/Config.h"

// -----------------------------------------------------------------------------
// Bijection between the alphabet and the available (Key, Role) slots.
// -----------------------------------------------------------------------------
//
// Two synchronized indexes: slot -> character index and character index -> slot.
// Every mutation goes through place() or swapSlots(), which update both.
//
// Text form used by parse()/serialize(): nine whitespace-separated groups, one
// per key in row-major order, each exactly ROLE_COUNT characters in role order
// (Tap, Up, Down, Left, Right). '_' marks an empty slot.
//
//   "e_ab_ t____ ..."  -> key TopLeft taps 'e', swipes up to '_'(empty), down 'a', left 'b'
//
// -----------------------------------------------------------------------------

class Layout {
public:
  static constexpr char EMPTY_MARK = '_';

  // Nothing placed yet; fill with place().
  explicit Layout(const Config& config);

  // Taps first (center, edges, corners), then swipe roles round-robin,
  // in alphabet order.
  static Layout reference(const Config& config);

  // Uniformly random assignment of the alphabet to available slots.
  static Layout random(const Config& config, std::mt19937_64& rng);

  // Throws LayoutError for malformed text or a non-bijective assignment.
  static Layout parse(const Config& config, const std::string& text);

  std::string serialize() const;

  // Throws LayoutError if c is unknown or already placed, or s is taken or unavailable.
  void place(char c, SlotId s);

  // Exchange the contents of two available slots (either may be empty).
  void swapSlots(SlotId a, SlotId b);

  const std::string& alphabet() const { return alphabet_; }
  int size() const { return static_cast<int>(alphabet_.size()); }

  // -1 if c is not in the alphabet
  int charIndex(char c) const { return charToIndex_[static_cast<unsigned char>(c)]; }

  // -1 / '\0' for an empty slot
  int indexAt(SlotId s) const { return slotToIndex_[s]; }
  char charAt(SlotId s) const;

  SlotId slotOfIndex(int i) const { return indexToSlot_[i]; }
  SlotId slotOf(char c) const;

  bool isAvailable(SlotId s) const { return s >= 0 && s < SLOT_COUNT && available_[s]; }
  bool isOccupied(SlotId s) const { return slotToIndex_[s] >= 0; }

  // Same alphabet (in the same order) and same available slots.
  bool compatibleWith(const Config& config) const;

  // Throws LayoutError describing the first violated invariant.
  void validate() const;

  bool operator==(const Layout& other) const {
    return alphabet_ == other.alphabet_ && slotToIndex_ == other.slotToIndex_;
  }
  bool operator!=(const Layout& other) const { return !(*this == other); }

  friend std::ostream& operator<<(std::ostream& os, const Layout& layout);

private:
  std::string alphabet_;
  std::array<int, 256> charToIndex_;
  std::array<int, SLOT_COUNT> slotToIndex_;
  std::array<bool, SLOT_COUNT> available_;
  std::vector<SlotId> indexToSlot_;
};

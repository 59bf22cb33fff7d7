#include "Layout.h"

#include <algorithm>
#include <sstream>

#include "Utils/Errors.h"
#include "Utils/StringUtils.h"

using namespace std;

// Fill order for taps: center, then edges, then corners.
static const array<Key, KEY_COUNT> TAP_ORDER = {
  Key::Key_Center,
  Key::Key_Top, Key::Key_Left, Key::Key_Right, Key::Key_Bottom,
  Key::Key_TopLeft, Key::Key_TopRight, Key::Key_BottomLeft, Key::Key_BottomRight,
};

static const array<Role, ROLE_COUNT - 1> SWIPE_ROLES = {
  Role::SwipeUp, Role::SwipeDown, Role::SwipeLeft, Role::SwipeRight,
};

Layout::Layout(const Config& config) : alphabet_(config.alphabet) {
  charToIndex_.fill(-1);
  slotToIndex_.fill(-1);
  for (int i = 0; i < size(); i++) {
    charToIndex_[static_cast<unsigned char>(alphabet_[i])] = i;
  }
  for (SlotId s = 0; s < SLOT_COUNT; s++) {
    available_[s] = config.isAvailable(s);
  }
  indexToSlot_.assign(alphabet_.size(), NO_SLOT);
}

Layout Layout::reference(const Config& config) {
  config.validate();
  Layout layout(config);

  vector<SlotId> order;
  for (Key k : TAP_ORDER) {
    order.push_back(makeSlot(k, Role::Tap));
  }
  for (Role r : SWIPE_ROLES) {
    for (Key k : TAP_ORDER) {
      order.push_back(makeSlot(k, r));
    }
  }

  int next = 0;
  for (SlotId s : order) {
    if (next == layout.size()) break;
    if (!layout.isAvailable(s)) continue;
    layout.place(layout.alphabet_[next++], s);
  }
  return layout;
}

Layout Layout::random(const Config& config, mt19937_64& rng) {
  config.validate();
  Layout layout(config);

  vector<SlotId> slots;
  for (SlotId s = 0; s < SLOT_COUNT; s++) {
    if (layout.isAvailable(s)) slots.push_back(s);
  }
  shuffle(slots.begin(), slots.end(), rng);

  for (int i = 0; i < layout.size(); i++) {
    layout.place(layout.alphabet_[i], slots[i]);
  }
  return layout;
}

Layout Layout::parse(const Config& config, const string& text) {
  config.validate();
  if (config.alphabet.find(EMPTY_MARK) != string::npos) {
    throw LayoutError(string("cannot parse a layout whose alphabet contains '") + EMPTY_MARK + "'");
  }

  Layout layout(config);
  istringstream in(text);
  string group;
  int key = 0;
  while (in >> group) {
    if (key >= KEY_COUNT) {
      throw LayoutError("layout text has more than " + to_string(KEY_COUNT) + " key groups");
    }
    if (group.size() != ROLE_COUNT) {
      throw LayoutError("key group '" + group + "' must have exactly " +
                        to_string(ROLE_COUNT) + " characters");
    }
    for (int r = 0; r < ROLE_COUNT; r++) {
      if (group[r] == EMPTY_MARK) continue;
      layout.place(group[r], key * ROLE_COUNT + r);
    }
    key++;
  }
  if (key != KEY_COUNT) {
    throw LayoutError("layout text has " + to_string(key) + " key groups, expected " +
                      to_string(KEY_COUNT));
  }

  layout.validate();
  return layout;
}

string Layout::serialize() const {
  string out;
  for (int k = 0; k < KEY_COUNT; k++) {
    if (k > 0) out += ' ';
    for (int r = 0; r < ROLE_COUNT; r++) {
      int idx = slotToIndex_[k * ROLE_COUNT + r];
      out += idx >= 0 ? alphabet_[idx] : EMPTY_MARK;
    }
  }
  return out;
}

void Layout::place(char c, SlotId s) {
  int idx = charIndex(c);
  if (idx < 0) {
    throw LayoutError("character '" + makePrintable(c) + "' is not in the alphabet");
  }
  if (indexToSlot_[idx] != NO_SLOT) {
    throw LayoutError("character '" + makePrintable(c) + "' is placed twice");
  }
  if (!isAvailable(s)) {
    throw LayoutError("slot " + slotName(s) + " is not available in this configuration");
  }
  if (slotToIndex_[s] >= 0) {
    throw LayoutError("slot " + slotName(s) + " already holds '" +
                      makePrintable(alphabet_[slotToIndex_[s]]) + "'");
  }
  slotToIndex_[s] = idx;
  indexToSlot_[idx] = s;
}

void Layout::swapSlots(SlotId a, SlotId b) {
  if (!isAvailable(a) || !isAvailable(b)) {
    throw LayoutError("cannot swap " + slotName(a) + " and " + slotName(b) +
                      ": slot not available");
  }
  int ia = slotToIndex_[a];
  int ib = slotToIndex_[b];
  slotToIndex_[a] = ib;
  slotToIndex_[b] = ia;
  if (ia >= 0) indexToSlot_[ia] = b;
  if (ib >= 0) indexToSlot_[ib] = a;
}

char Layout::charAt(SlotId s) const {
  int idx = slotToIndex_[s];
  return idx >= 0 ? alphabet_[idx] : '\0';
}

SlotId Layout::slotOf(char c) const {
  int idx = charIndex(c);
  if (idx < 0) {
    throw LayoutError("character '" + makePrintable(c) + "' is not in the alphabet");
  }
  return indexToSlot_[idx];
}

bool Layout::compatibleWith(const Config& config) const {
  if (alphabet_ != config.alphabet) return false;
  for (SlotId s = 0; s < SLOT_COUNT; s++) {
    if (available_[s] != config.isAvailable(s)) return false;
  }
  return true;
}

void Layout::validate() const {
  for (int i = 0; i < size(); i++) {
    SlotId s = indexToSlot_[i];
    if (s == NO_SLOT) {
      throw LayoutError("character '" + makePrintable(alphabet_[i]) + "' has no slot");
    }
    if (!isAvailable(s)) {
      throw LayoutError("character '" + makePrintable(alphabet_[i]) + "' is on unavailable slot " +
                        slotName(s));
    }
    if (slotToIndex_[s] != i) {
      throw LayoutError("slot " + slotName(s) + " does not point back to '" +
                        makePrintable(alphabet_[i]) + "'");
    }
  }
  int occupied = 0;
  for (SlotId s = 0; s < SLOT_COUNT; s++) {
    int idx = slotToIndex_[s];
    if (idx < 0) continue;
    occupied++;
    if (idx >= size() || indexToSlot_[idx] != s) {
      throw LayoutError("slot " + slotName(s) + " holds a character mapped elsewhere");
    }
  }
  if (occupied != size()) {
    throw LayoutError("layout has " + to_string(occupied) + " occupied slots for " +
                      to_string(size()) + " characters");
  }
}

// Each key prints as a 3x7 cell:
//
//     u
//   l t r
//     d
//
ostream& operator<<(ostream& os, const Layout& layout) {
  auto at = [&](int key, Role r) {
    char c = layout.charAt(key * ROLE_COUNT + static_cast<int>(r));
    return c == '\0' ? ' ' : c;
  };

  for (int row = 0; row < GRID_SIZE; row++) {
    for (int col = 0; col < GRID_SIZE; col++) {
      int k = row * GRID_SIZE + col;
      os << "   " << at(k, Role::SwipeUp) << "   " << (col + 1 < GRID_SIZE ? "|" : "");
    }
    os << '\n';
    for (int col = 0; col < GRID_SIZE; col++) {
      int k = row * GRID_SIZE + col;
      os << ' ' << at(k, Role::SwipeLeft) << ' ' << at(k, Role::Tap) << ' '
         << at(k, Role::SwipeRight) << ' ' << (col + 1 < GRID_SIZE ? "|" : "");
    }
    os << '\n';
    for (int col = 0; col < GRID_SIZE; col++) {
      int k = row * GRID_SIZE + col;
      os << "   " << at(k, Role::SwipeDown) << "   " << (col + 1 < GRID_SIZE ? "|" : "");
    }
    os << '\n';
    if (row + 1 < GRID_SIZE) {
      os << "-------+-------+-------\n";
    }
  }
  return os;
}

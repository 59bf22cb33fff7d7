#pragma once

#include <array>
#include <cstdint>
#include <ostream>
#include <string>

#include "XMacroKeyDefinitions.h"

static constexpr int GRID_SIZE  = 3;
static constexpr int KEY_COUNT  = GRID_SIZE * GRID_SIZE;
static constexpr int ROLE_COUNT = 5; // tap + four swipe directions
static constexpr int SLOT_COUNT = KEY_COUNT * ROLE_COUNT;

#define ENUM_VALUE(name, str) name,
enum class Key : int8_t {
    SWIPEFICIENCY_KEYS(ENUM_VALUE)
    None
};

enum class Role : int8_t {
    SWIPEFICIENCY_ROLES(ENUM_VALUE)
    None
};

enum class KeyRelation : int8_t {
    SWIPEFICIENCY_KEY_RELATIONS(ENUM_VALUE)
};
#undef ENUM_VALUE

static_assert(KEY_COUNT == static_cast<int>(Key::None), "key counts do not match");
static_assert(ROLE_COUNT == static_cast<int>(Role::None), "role counts do not match");

// A (Key, Role) pair, encoded as key * ROLE_COUNT + role.
using SlotId = int;
static constexpr SlotId NO_SLOT = -1;

struct Vec2 {
  double x = 0.0;
  double y = 0.0;

  Vec2() = default;
  Vec2(double x, double y) : x(x), y(y) {}

  Vec2 operator+(const Vec2& o) const { return {x + o.x, y + o.y}; }
  Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
  Vec2 operator*(double s) const { return {x * s, y * s}; }

  double length() const;
};

double distance(const Vec2& a, const Vec2& b);

inline SlotId makeSlot(Key k, Role r) {
  return static_cast<int>(k) * ROLE_COUNT + static_cast<int>(r);
}

inline Key slotKey(SlotId s) {
  return static_cast<Key>(s / ROLE_COUNT);
}

inline Role slotRole(SlotId s) {
  return static_cast<Role>(s % ROLE_COUNT);
}

inline bool isSwipe(Role r) {
  return r != Role::Tap && r != Role::None;
}

inline bool isSwipeSlot(SlotId s) {
  return isSwipe(slotRole(s));
}

inline int keyRow(Key k) { return static_cast<int>(k) / GRID_SIZE; }
inline int keyCol(Key k) { return static_cast<int>(k) % GRID_SIZE; }

// Unit vector of the swipe gesture in screen coordinates (y grows downward).
// Zero vector for Tap.
Vec2 swipeDirection(Role r);

// Same key, keys sharing a side, keys sharing only a corner, or none of those.
KeyRelation keyRelation(Key a, Key b);

const char* keyName(Key k);
const char* roleName(Role r);
const char* relationName(KeyRelation rel);

// "Center/Up" style label for diagnostics.
std::string slotName(SlotId s);

std::ostream& operator<<(std::ostream& os, Key k);
std::ostream& operator<<(std::ostream& os, Role r);

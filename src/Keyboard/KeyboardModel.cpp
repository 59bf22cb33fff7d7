#include "KeyboardModel.h"

#include <cmath>
#include <cstdlib>

// Generate name arrays from same source
#define STRING_VALUE(name, str) str,
static const char *g_key_names[] = {SWIPEFICIENCY_KEYS(STRING_VALUE)};
static const char *g_role_names[] = {SWIPEFICIENCY_ROLES(STRING_VALUE)};
static const char *g_relation_names[] = {SWIPEFICIENCY_KEY_RELATIONS(STRING_VALUE)};
#undef STRING_VALUE

double Vec2::length() const {
  return std::sqrt(x * x + y * y);
}

double distance(const Vec2& a, const Vec2& b) {
  return (a - b).length();
}

Vec2 swipeDirection(Role r) {
  switch (r) {
    case Role::SwipeUp:    return { 0.0, -1.0};
    case Role::SwipeDown:  return { 0.0,  1.0};
    case Role::SwipeLeft:  return {-1.0,  0.0};
    case Role::SwipeRight: return { 1.0,  0.0};
    default:               return { 0.0,  0.0};
  }
}

KeyRelation keyRelation(Key a, Key b) {
  int dr = std::abs(keyRow(a) - keyRow(b));
  int dc = std::abs(keyCol(a) - keyCol(b));
  if (dr == 0 && dc == 0) return KeyRelation::SameKey;
  if (dr + dc == 1)       return KeyRelation::SideNeighbor;
  if (dr == 1 && dc == 1) return KeyRelation::CornerNeighbor;
  return KeyRelation::Unrelated;
}

const char* keyName(Key k) {
  if (k == Key::None) return "None";
  return g_key_names[static_cast<int>(k)];
}

const char* roleName(Role r) {
  if (r == Role::None) return "None";
  return g_role_names[static_cast<int>(r)];
}

const char* relationName(KeyRelation rel) {
  return g_relation_names[static_cast<int>(rel)];
}

std::string slotName(SlotId s) {
  if (s < 0 || s >= SLOT_COUNT) return "NoSlot";
  return std::string(keyName(slotKey(s))) + "/" + roleName(slotRole(s));
}

std::ostream& operator<<(std::ostream& os, Key k) {
  return os << keyName(k);
}

std::ostream& operator<<(std::ostream& os, Role r) {
  return os << roleName(r);
}

#pragma once

#include <utility>
#include <vector>

#include "Layout/Layout.h"

struct RankedLayout {
  Layout layout;
  double cost;

  RankedLayout(Layout l, double c) : layout(std::move(l)), cost(c) {}
};

// Bounded list of the cheapest distinct layouts seen so far, cheapest first.
// Equal costs keep arrival order.
class TopLayouts {
public:
  explicit TopLayouts(int capacity) : capacity(capacity) {}

  // True if the layout entered the list.
  bool offer(const Layout& layout, double cost);

  // Would a layout of this cost enter the list (ignoring duplicates)?
  bool admits(double cost) const {
    return static_cast<int>(entries.size()) < capacity || cost < entries.back().cost;
  }

  const std::vector<RankedLayout>& ranked() const { return entries; }
  std::vector<RankedLayout> release() { return std::move(entries); }

  int size() const { return static_cast<int>(entries.size()); }
  bool empty() const { return entries.empty(); }

private:
  int capacity;
  std::vector<RankedLayout> entries;
};

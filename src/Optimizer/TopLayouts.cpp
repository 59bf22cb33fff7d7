#include "TopLayouts.h"

#include <algorithm>

using namespace std;

bool TopLayouts::offer(const Layout& layout, double cost) {
  if (capacity <= 0 || !admits(cost)) return false;

  for (const RankedLayout& e : entries) {
    if (e.layout == layout) return false;
  }

  auto pos = upper_bound(entries.begin(), entries.end(), cost,
                         [](double c, const RankedLayout& e) { return c < e.cost; });
  entries.insert(pos, RankedLayout(layout, cost));
  if (static_cast<int>(entries.size()) > capacity) {
    entries.pop_back();
  }
  return true;
}

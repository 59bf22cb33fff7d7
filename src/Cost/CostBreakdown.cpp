#include "CostBreakdown.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

#include "Utils/StringUtils.h"

using namespace std;

static constexpr size_t TOP_ENTRIES = 8;

string CostBreakdown::to_string() const {
  ostringstream oss;
  oss << *this;
  return oss.str();
}

ostream& operator<<(ostream& os, const CostBreakdown& b) {
  ios_base::fmtflags flags = os.flags();
  streamsize precision = os.precision();
  os << fixed << setprecision(6);
  os << "total: " << b.total << "  (base " << b.base << ", swipe penalty " << b.swipePenalty << ")\n";

  vector<CharCost> chars = b.baseByChar;
  stable_sort(chars.begin(), chars.end(),
              [](const CharCost& x, const CharCost& y) { return x.cost > y.cost; });
  os << "base by character:";
  for (size_t i = 0; i < chars.size() && i < TOP_ENTRIES; i++) {
    os << "  " << makePrintable(chars[i].c) << "=" << chars[i].cost;
  }
  os << '\n';

  vector<PairPenalty> pairs = b.penaltyByPair;
  stable_sort(pairs.begin(), pairs.end(),
              [](const PairPenalty& x, const PairPenalty& y) { return x.cost > y.cost; });
  os << "swipe penalty by pair:";
  for (size_t i = 0; i < pairs.size() && i < TOP_ENTRIES; i++) {
    os << "  " << makePrintable(pairs[i].a) << makePrintable(pairs[i].b) << "=" << pairs[i].cost;
  }
  os << '\n';
  os.flags(flags);
  os.precision(precision);
  return os;
}

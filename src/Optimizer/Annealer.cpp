#include "Annealer.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <optional>
#include <vector>

#include "Utils/Debug.h"
#include "Utils/Errors.h"

using namespace std;

// Incremental deltas drift; re-anchor the running cost every so often.
static constexpr long long RESYNC_INTERVAL = 4096;

// Refine ignores swaps that only win by rounding noise.
static constexpr double IMPROVEMENT_EPS = 1e-12;

// Replace tracked costs by full totals and restore cheapest-first order.
static vector<RankedLayout> rescore(const CostModel& model, vector<RankedLayout> entries) {
  for (RankedLayout& e : entries) {
    e.cost = model.total(e.layout);
  }
  stable_sort(entries.begin(), entries.end(),
              [](const RankedLayout& x, const RankedLayout& y) { return x.cost < y.cost; });
  return entries;
}

Move Annealer::proposeMove(const Layout& layout, double withinKeyProbability) {
  uniform_int_distribution<int> pickChar(0, layout.size() - 1);
  SlotId a = layout.slotOfIndex(pickChar(rng));

  vector<SlotId> options;
  options.reserve(SLOT_COUNT);

  if (unit(rng) < withinKeyProbability) {
    int key = static_cast<int>(slotKey(a));
    for (int r = 0; r < ROLE_COUNT; r++) {
      SlotId s = key * ROLE_COUNT + r;
      if (s != a && layout.isAvailable(s)) options.push_back(s);
    }
    if (!options.empty()) {
      uniform_int_distribution<size_t> pick(0, options.size() - 1);
      return {MoveKind::SwapWithinKey, a, options[pick(rng)]};
    }
  }

  for (SlotId s = 0; s < SLOT_COUNT; s++) {
    if (s != a && layout.isAvailable(s)) options.push_back(s);
  }
  uniform_int_distribution<size_t> pick(0, options.size() - 1);
  return {MoveKind::SwapSlots, a, options[pick(rng)]};
}

bool Annealer::accept(double delta, double temperature) {
  if (delta <= 0.0) return true;
  if (temperature <= 0.0) return false;
  return unit(rng) < exp(-delta / temperature);
}

AnnealResult Annealer::run(const Layout& start, const AnnealParams& params,
                           const IterationObserver& observer) {
  params.validate();
  model.checkLayout(start);

  Layout current = start;
  double currentCost = model.total(current);
  Layout best = current;
  double bestCost = currentCost;
  double temperature = params.initialTemperature;
  AnnealStats stats;
  TopLayouts top(params.keepTop);
  top.offer(current, currentCost);

  debug("anneal: start cost", currentCost, "T0", temperature, "budget", params.maxIterations);

  bool canMove = current.size() > 0 && model.config().capacity() > 1;
  if (!canMove) {
    debug("anneal: no move possible, returning the start layout");
  }

  while (canMove && stats.iterations < params.maxIterations &&
         temperature >= params.minTemperature) {
    Move move = proposeMove(current, params.withinKeyProbability);

    double candidateCost;
    if (params.incremental) {
      candidateCost = currentCost + model.swapDelta(current, move.a, move.b);
    } else {
      Layout candidate = current;
      candidate.swapSlots(move.a, move.b);
      candidateCost = model.total(candidate);
    }

    bool accepted = accept(candidateCost - currentCost, temperature);
    if (accepted) {
      current.swapSlots(move.a, move.b);
      currentCost = candidateCost;
      stats.accepted++;
      if (currentCost < bestCost) {
        best = current;
        bestCost = currentCost;
        stats.improvedBest++;
        debug("anneal: new best", bestCost, "at iteration", stats.iterations, "T", temperature);
      }
      top.offer(current, currentCost);
    }

    stats.iterations++;
    if (observer) {
      observer({stats.iterations, temperature, currentCost, bestCost, accepted, 0});
    }

    if (stats.iterations % params.iterationsPerTemperature == 0) {
      temperature *= params.coolingRate;
    }
    if (params.incremental && stats.iterations % RESYNC_INTERVAL == 0) {
      currentCost = model.total(current);
      bestCost = model.total(best);
      TopLayouts resynced(params.keepTop);
      for (RankedLayout& e : rescore(model, top.release())) {
        resynced.offer(e.layout, e.cost);
      }
      top = std::move(resynced);
    }
  }

  stats.finalTemperature = temperature;

  // Exact totals can reorder near-ties of the tracked costs; report the exact minimum.
  vector<RankedLayout> ranked = rescore(model, top.release());
  AnnealResult result(ranked.front().layout, model.evaluate(ranked.front().layout), stats);
  result.top = std::move(ranked);
  debug("anneal: done after", stats.iterations, "iterations, best", result.cost(),
        "accepted", stats.accepted);
  return result;
}

AnnealResult Annealer::refine(const Layout& start, long long maxPasses) {
  model.checkLayout(start);

  Layout current = start;
  AnnealStats stats;

  vector<SlotId> slots;
  for (SlotId s = 0; s < SLOT_COUNT; s++) {
    if (current.isAvailable(s)) slots.push_back(s);
  }

  while (stats.iterations < maxPasses) {
    double bestDelta = -IMPROVEMENT_EPS;
    SlotId bestA = NO_SLOT, bestB = NO_SLOT;
    for (size_t i = 0; i < slots.size(); i++) {
      for (size_t j = i + 1; j < slots.size(); j++) {
        if (!current.isOccupied(slots[i]) && !current.isOccupied(slots[j])) continue;
        double delta = model.swapDelta(current, slots[i], slots[j]);
        if (delta < bestDelta) {
          bestDelta = delta;
          bestA = slots[i];
          bestB = slots[j];
        }
      }
    }
    stats.iterations++;
    if (bestA == NO_SLOT) break;

    current.swapSlots(bestA, bestB);
    stats.accepted++;
    stats.improvedBest++;
    debug("refine: swap", slotName(bestA), slotName(bestB), "delta", bestDelta);
  }

  AnnealResult result(current, model.evaluate(current), stats);
  result.top.emplace_back(current, result.cost());
  return result;
}

AnnealResult runChains(const CostModel& model, const Layout& start,
                       const AnnealParams& params, int chains,
                       const IterationObserver& observer) {
  if (chains < 1) {
    throw ConfigError("chain count must be at least 1, got " + to_string(chains));
  }
  params.validate();
  model.checkLayout(start);

  vector<optional<AnnealResult>> results(chains);
  vector<exception_ptr> errors(chains);

  // Exceptions cannot leave an OpenMP region; collect and rethrow after the join.
  #pragma omp parallel for schedule(dynamic)
  for (int c = 0; c < chains; c++) {
    try {
      seed_seq seq{static_cast<uint32_t>(params.seed),
                   static_cast<uint32_t>(params.seed >> 32),
                   static_cast<uint32_t>(c)};
      mt19937_64 rng(seq);
      Annealer annealer(model, rng);
      IterationObserver tagged = nullptr;
      if (observer) {
        tagged = [&observer, c](const IterationInfo& info) {
          IterationInfo withChain = info;
          withChain.chain = c;
          observer(withChain);
        };
      }
      results[c].emplace(annealer.run(start, params, tagged));
      results[c]->chain = c;
    } catch (...) {
      errors[c] = current_exception();
    }
  }
  for (const exception_ptr& e : errors) {
    if (e) rethrow_exception(e);
  }

  int winner = 0;
  for (int c = 1; c < chains; c++) {
    if (results[c]->cost() < results[winner]->cost()) winner = c;
  }
  // Pool every chain's list; chain order breaks cost ties.
  vector<RankedLayout> pooled;
  for (int c = 0; c < chains; c++) {
    for (const RankedLayout& e : results[c]->top) pooled.push_back(e);
  }
  stable_sort(pooled.begin(), pooled.end(),
              [](const RankedLayout& x, const RankedLayout& y) { return x.cost < y.cost; });
  TopLayouts top(params.keepTop);
  for (const RankedLayout& e : pooled) {
    top.offer(e.layout, e.cost);
  }

  debug("chains:", chains, "winner", winner, "cost", results[winner]->cost());
  AnnealResult result = std::move(*results[winner]);
  result.top = top.release();
  return result;
}

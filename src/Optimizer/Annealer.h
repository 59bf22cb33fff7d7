#pragma once

#include <functional>
#include <random>
#include <utility>

#include "AnnealParams.h"
#include "Result.h"
#include "Cost/CostModel.h"
#include "Layout/Layout.h"

enum class MoveKind { SwapSlots, SwapWithinKey };

struct Move {
  MoveKind kind;
  SlotId a;
  SlotId b;
};

// Reported after every iteration, accepted or not.
struct IterationInfo {
  long long iteration;
  double temperature;
  double currentCost;
  double bestCost;
  bool accepted;
  int chain;   // index within runChains(), 0 for a single run
};

using IterationObserver = std::function<void(const IterationInfo&)>;

// -----------------------------------------------------------------------------
// Simulated annealing over layouts.
// -----------------------------------------------------------------------------
//
// The generator is owned by the caller, so a seed fully determines a run.
// Every move exchanges the contents of two available slots, at least one of
// them occupied, so candidates are always complete bijections.
//
// -----------------------------------------------------------------------------

class Annealer {
public:
  Annealer(const CostModel& model, std::mt19937_64& rng) : model(model), rng(rng) {}

  // Throws ConfigError / LayoutError before the first iteration.
  AnnealResult run(const Layout& start, const AnnealParams& params,
                   const IterationObserver& observer = nullptr);

  // Random move on layout. withinKeyProbability picks SwapWithinKey.
  Move proposeMove(const Layout& layout, double withinKeyProbability);

  // Metropolis criterion
  bool accept(double delta, double temperature);

  // Steepest descent over every slot pair until no swap improves.
  AnnealResult refine(const Layout& start, long long maxPasses = 1000);

private:
  const CostModel& model;
  std::mt19937_64& rng;

  std::uniform_real_distribution<double> unit{0.0, 1.0};
};

// Independent chains (OpenMP), seeded from params.seed and the chain index.
// Lowest total wins; ties go to the lower chain index. The result's top list
// pools every chain. The observer is called from worker threads concurrently.
AnnealResult runChains(const CostModel& model, const Layout& start,
                       const AnnealParams& params, int chains,
                       const IterationObserver& observer = nullptr);

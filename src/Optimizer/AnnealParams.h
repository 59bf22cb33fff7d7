#pragma once

#include <cstdint>
#include <optional>

// Annealing schedule and move mix.
// Can be set as defaults in constructor and optionally overridden per-call.
struct AnnealParams {
  double initialTemperature = 0.05;
  double coolingRate = 0.9995;       // T <- T * coolingRate
  int iterationsPerTemperature = 10; // iterations between cooling steps
  long long maxIterations = 200000;
  double minTemperature = 1e-7;      // stop once T drops below this

  // Chance that a move swaps two roles of the same key instead of two arbitrary slots
  double withinKeyProbability = 0.25;

  // Distinct low-cost layouts reported alongside the best
  int keepTop = 1;

  // Score candidates by swap delta instead of full recomputation
  bool incremental = true;

  // Used by runChains() and the CLI; Annealer::run takes its generator from the caller
  uint64_t seed = 0x5eed;

  AnnealParams() = default;

  // Convenience constructor for common case of just setting the budget
  explicit AnnealParams(long long maxIterations)
      : maxIterations(maxIterations) {}

  AnnealParams(long long maxIterations, double initialTemperature,
               double coolingRate = 0.9995, int iterationsPerTemperature = 10)
      : initialTemperature(initialTemperature),
        coolingRate(coolingRate),
        iterationsPerTemperature(iterationsPerTemperature),
        maxIterations(maxIterations) {}

  // Throws ConfigError.
  void validate() const;

  // For simple structs, we just use the override directly if provided
  static AnnealParams merge(const AnnealParams& defaults,
                            const std::optional<AnnealParams>& override) {
    return override.value_or(defaults);
  }
};

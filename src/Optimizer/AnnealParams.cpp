#include "AnnealParams.h"

#include <cmath>
#include <string>

#include "Utils/Errors.h"

using namespace std;

void AnnealParams::validate() const {
  if (!(initialTemperature > 0.0) || !isfinite(initialTemperature)) {
    throw ConfigError("initial temperature must be positive, got " + to_string(initialTemperature));
  }
  if (!(coolingRate > 0.0 && coolingRate <= 1.0)) {
    throw ConfigError("cooling rate must be in (0, 1], got " + to_string(coolingRate));
  }
  if (iterationsPerTemperature <= 0) {
    throw ConfigError("iterations per temperature must be positive, got " +
                      to_string(iterationsPerTemperature));
  }
  if (maxIterations < 0) {
    throw ConfigError("iteration budget must not be negative, got " + to_string(maxIterations));
  }
  if (!(minTemperature >= 0.0)) {
    throw ConfigError("temperature floor must not be negative, got " + to_string(minTemperature));
  }
  if (keepTop < 1) {
    throw ConfigError("number of reported layouts must be at least 1, got " + to_string(keepTop));
  }
  if (!(withinKeyProbability >= 0.0 && withinKeyProbability <= 1.0)) {
    throw ConfigError("within-key move probability must be in [0, 1], got " +
                      to_string(withinKeyProbability));
  }
}

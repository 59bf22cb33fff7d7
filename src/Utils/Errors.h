#pragma once

#include <stdexcept>
#include <string>

// Bad configuration (alphabet, geometry, weights, annealing parameters).
// Always raised before any search work starts.
struct ConfigError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// A layout that is not a bijection between the alphabet and available slots,
// or that does not belong to the configuration it is used with.
struct LayoutError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Command line that cannot be understood (unknown option or command, missing value).
struct UsageError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

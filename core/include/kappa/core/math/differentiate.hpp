#pragma once
#include "kappa/core/common/status.hpp"

#include <cstdint>
#include <vector>

namespace kappa::core {

enum class DifferenceScheme : std::uint8_t {
  Central = 0,   // second-order on non-uniform grids; one-sided at the ends
  Forward = 1,
  Backward = 2
};

const char* differenceSchemeToString(DifferenceScheme s);

// Neighbourhood of one sample: (t, y) plus optional predecessor / successor.
struct DifferenceWindow {
  double t{0.0};
  double y{0.0};

  bool has_prev{false};
  double t_prev{0.0};
  double y_prev{0.0};

  bool has_next{false};
  double t_next{0.0};
  double y_next{0.0};
};

// dy/dt at the window centre.
//
// A side is usable when it exists and its time delta is > `min_dt`. `Central` combines both
// usable sides; every scheme falls back to whichever single side is usable, preferring its own.
// Returns NaN when no side is usable (e.g. repeated timestamps on both sides).
double differenceAt(const DifferenceWindow& w, DifferenceScheme scheme, double min_dt = 0.0);

// Applies `differenceAt` along a sequence. `t` and `y` must have equal size >= 2 and `t`
// must be non-decreasing; entries of `dydt` are NaN where the derivative is undefined.
Status timeDerivative(const std::vector<double>& t,
                      const std::vector<double>& y,
                      DifferenceScheme scheme,
                      double min_dt,
                      std::vector<double>* dydt);

}  // namespace kappa::core

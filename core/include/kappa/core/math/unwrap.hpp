#pragma once
#include <vector>

namespace kappa::core {

// Causal phase unwrapping with period 2*pi.
//
// Each raw step d = raw[i] - raw[i-1] with |d| >= pi is replaced by its representative in
// [-pi, pi) (keeping +pi when d > 0); the difference is folded into a running offset that
// is added to every later sample. Same result as numpy.unwrap with the default discont.
class AngleUnwrapper {
public:
  double next(double raw);
  void reset();

  double offset() const { return offset_; }

private:
  bool has_prev_{false};
  double prev_raw_{0.0};
  double offset_{0.0};
};

std::vector<double> unwrapAngles(const std::vector<double>& raw);

}  // namespace kappa::core

#include "kappa/core/math/unwrap.hpp"

#include <cmath>

namespace kappa::core {

double AngleUnwrapper::next(double raw) {
  if (!has_prev_) {
    has_prev_ = true;
    prev_raw_ = raw;
    return raw + offset_;
  }

  const double d = raw - prev_raw_;
  prev_raw_ = raw;
  if (std::abs(d) >= M_PI) {
    double dd = std::fmod(d + M_PI, 2.0 * M_PI);
    if (dd < 0.0) dd += 2.0 * M_PI;
    dd -= M_PI;
    if (dd == -M_PI && d > 0.0) dd = M_PI;
    offset_ += dd - d;
  }
  return raw + offset_;
}

void AngleUnwrapper::reset() {
  has_prev_ = false;
  prev_raw_ = 0.0;
  offset_ = 0.0;
}

std::vector<double> unwrapAngles(const std::vector<double>& raw) {
  std::vector<double> out;
  out.reserve(raw.size());
  AngleUnwrapper unwrapper;
  for (double a : raw) out.push_back(unwrapper.next(a));
  return out;
}

}  // namespace kappa::core

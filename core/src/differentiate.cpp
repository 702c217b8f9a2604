// Finite differences on non-uniform time grids.
// Interior `Central` estimate (hb = t - t_prev, hf = t_next - t):
//   (hb^2 * y_next + (hf^2 - hb^2) * y - hf^2 * y_prev) / (hb * hf * (hb + hf))
// which is exact for quadratics and reduces to (y_next - y_prev) / (2h) on a uniform grid.
#include "kappa/core/math/differentiate.hpp"

#include "kappa/core/common/logger.hpp"

#include <cmath>
#include <limits>

namespace kappa::core {

const char* differenceSchemeToString(DifferenceScheme s) {
  switch (s) {
    case DifferenceScheme::Central: return "central";
    case DifferenceScheme::Forward: return "forward";
    case DifferenceScheme::Backward: return "backward";
  }
  return "unknown";
}

double differenceAt(const DifferenceWindow& w, DifferenceScheme scheme, double min_dt) {
  const double hb = w.has_prev ? (w.t - w.t_prev) : 0.0;
  const double hf = w.has_next ? (w.t_next - w.t) : 0.0;
  const bool back_ok = w.has_prev && hb > min_dt && hb > 0.0;
  const bool fwd_ok = w.has_next && hf > min_dt && hf > 0.0;

  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double slope_b = back_ok ? (w.y - w.y_prev) / hb : nan;
  const double slope_f = fwd_ok ? (w.y_next - w.y) / hf : nan;

  switch (scheme) {
    case DifferenceScheme::Central:
      if (back_ok && fwd_ok) {
        return (hb * hb * w.y_next + (hf * hf - hb * hb) * w.y - hf * hf * w.y_prev) /
               (hb * hf * (hb + hf));
      }
      return back_ok ? slope_b : slope_f;

    case DifferenceScheme::Forward:
      return fwd_ok ? slope_f : slope_b;

    case DifferenceScheme::Backward:
      return back_ok ? slope_b : slope_f;
  }
  return nan;
}

Status timeDerivative(const std::vector<double>& t,
                      const std::vector<double>& y,
                      DifferenceScheme scheme,
                      double min_dt,
                      std::vector<double>* dydt) {
  if (!dydt) {
    log(LogLevel::Error, "timeDerivative: output is null");
    return Status::InvalidParameter;
  }
  if (t.size() != y.size()) {
    log(LogLevel::Error, "timeDerivative: t and y sizes differ");
    return Status::ShapeMismatch;
  }
  if (t.size() < 2) {
    log(LogLevel::Error, "timeDerivative: need at least 2 samples");
    return Status::InsufficientSamples;
  }
  if (!(min_dt >= 0.0) || !std::isfinite(min_dt)) {
    log(LogLevel::Error, "timeDerivative: min_dt must be finite and >= 0");
    return Status::InvalidParameter;
  }
  for (std::size_t i = 1; i < t.size(); ++i) {
    if (t[i] < t[i - 1]) {
      log(LogLevel::Error, "timeDerivative: t must be non-decreasing");
      return Status::UnorderedTimestamps;
    }
  }

  const std::size_t n = t.size();
  dydt->assign(n, 0.0);
  for (std::size_t i = 0; i < n; ++i) {
    DifferenceWindow w;
    w.t = t[i];
    w.y = y[i];
    if (i > 0) {
      w.has_prev = true;
      w.t_prev = t[i - 1];
      w.y_prev = y[i - 1];
    }
    if (i + 1 < n) {
      w.has_next = true;
      w.t_next = t[i + 1];
      w.y_next = y[i + 1];
    }
    (*dydt)[i] = differenceAt(w, scheme, min_dt);
  }
  return Status::Success;
}

}  // namespace kappa::core

#include "kappa/core/motion/motion_sample.hpp"

#include "kappa/core/common/logger.hpp"

#include <sstream>

namespace kappa::core {

void MotionLog::reserve(std::size_t n) {
  timestamps.reserve(n);
  orientations.reserve(n);
  velocities.reserve(n);
}

void MotionLog::push_back(const MotionSample& s) {
  timestamps.push_back(s.timestamp);
  orientations.push_back(s.orientation);
  velocities.push_back(s.velocity);
}

Status toSamples(const MotionLog& log, std::vector<MotionSample>* samples) {
  if (!samples) {
    kappa::core::log(LogLevel::Error, "toSamples: output is null");
    return Status::InvalidParameter;
  }
  if (!log.consistent()) {
    std::ostringstream oss;
    oss << "toSamples: column lengths differ (timestamps=" << log.timestamps.size()
        << ", orientations=" << log.orientations.size()
        << ", velocities=" << log.velocities.size() << ")";
    kappa::core::log(LogLevel::Error, oss.str());
    return Status::ShapeMismatch;
  }

  samples->clear();
  samples->reserve(log.size());
  for (std::size_t i = 0; i < log.size(); ++i) {
    samples->emplace_back(log.timestamps[i], log.orientations[i], log.velocities[i]);
  }
  return Status::Success;
}

}  // namespace kappa::core

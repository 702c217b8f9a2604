#pragma once
#include <cstdint>

namespace kappa::core {

// Result codes shared by the core and io layers. Per-sample degeneracies
// (stationary vehicle, repeated timestamp) are not errors and never show up here.
enum class Status : std::uint8_t {
  Success = 0,
  Failure = 1,
  InvalidParameter = 2,
  InsufficientSamples = 3,
  ShapeMismatch = 4,
  UnnormalizedOrientation = 5,
  InvalidOrientation = 6,
  UnorderedTimestamps = 7,
  ParseError = 8
};

inline constexpr bool ok(Status s) { return s == Status::Success; }

inline const char* statusToString(Status s) {
  switch (s) {
    case Status::Success: return "Success";
    case Status::Failure: return "Failure";
    case Status::InvalidParameter: return "InvalidParameter";
    case Status::InsufficientSamples: return "InsufficientSamples";
    case Status::ShapeMismatch: return "ShapeMismatch";
    case Status::UnnormalizedOrientation: return "UnnormalizedOrientation";
    case Status::InvalidOrientation: return "InvalidOrientation";
    case Status::UnorderedTimestamps: return "UnorderedTimestamps";
    case Status::ParseError: return "ParseError";
  }
  return "Unknown";
}

}  // namespace kappa::core

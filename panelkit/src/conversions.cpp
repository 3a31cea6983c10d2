// TU header --------------------------------------------
#include "panelkit/conversions.h"

// c++ headers ------------------------------------------
#include <cmath>

#include <stdexcept>

namespace panelkit {

namespace {

constexpr double kSeaLevelMillibars = 1013.25;
constexpr double kPressureExponent = 0.190284;
constexpr double kFeetScale = 145366.45;
constexpr double kInchesHgPerMillibar = 0.02953;

} // namespace

float MillibarsToFeet(float millibars) {
  return static_cast<float>((1.0 - std::pow(millibars / kSeaLevelMillibars, kPressureExponent)) * kFeetScale);
}

float FeetToMillibars(float feet) {
  return static_cast<float>(kSeaLevelMillibars * std::pow(1.0 - feet / kFeetScale, 1.0 / kPressureExponent));
}

float InchesHgToFeet(float inches_hg) {
  return MillibarsToFeet(InchesHgToMillibars(inches_hg));
}

float FeetToInchesHg(float feet) {
  return MillibarsToInchesHg(FeetToMillibars(feet));
}

float MillibarsToInchesHg(float millibars) {
  return static_cast<float>(kInchesHgPerMillibar * millibars);
}

float InchesHgToMillibars(float inches_hg) {
  return static_cast<float>(inches_hg / kInchesHgPerMillibar);
}

float NonLinearScale(float input, float mid, float max) {
  if (!(input >= 0.0f && input <= 1.0f)) {
    throw std::invalid_argument("NonLinearScale: input out of [0, 1]");
  }
  if (!(mid > 0.0f && mid < max)) {
    throw std::invalid_argument("NonLinearScale: mid must lie inside (0, max)");
  }

  // A + B * e^(C * input), with A = -B so that input 0 maps to 0.
  double const m = double(max) / double(mid);
  double const c = std::log((m - 1.0) * (m - 1.0));
  double const b = double(max) / (std::exp(c) - 1.0);
  double const result = -b + b * std::exp(c * double(input));

  // c == 0 for a linear scale, which degenerates to inf - inf.
  if (!std::isfinite(result)) {
    return max * input;
  }
  return static_cast<float>(result);
}

} // namespace panelkit

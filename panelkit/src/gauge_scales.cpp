// TU header --------------------------------------------
#include "panelkit/gauge_scales.h"

// c++ headers ------------------------------------------
#include <algorithm>
#include <stdexcept>

// project headers --------------------------------------
#include "panelkit/angle.h"
#include "panelkit/conversions.h"

namespace panelkit {

float AirspeedToAngle(float kias, AircraftLimits const& limits) {
  float const max = limits.max_displayed_speed;
  if (!(kias >= 0.0f && kias <= max)) {
    throw std::invalid_argument("AirspeedToAngle: speed outside the displayed range");
  }
  float const non_linear = NonLinearScale(kias / max, kAirspeedMidScale, max);
  // Zero sits at the max speed mark and the scale runs clockwise from there.
  float const circle = 360.0f * (non_linear / max);
  return ClockToMath(SignedDegreesToPositive360(kAirspeedMaxAngle + circle));
}

AltimeterNeedles AltitudeToNeedles(float feet) {
  return AltimeterNeedles{
    .hundreds = ClockToMath(feet / 1000.0f * 360.0f),
    .thousands = ClockToMath(feet / 10000.0f * 360.0f),
    .ten_thousands = ClockToMath(feet / 100000.0f * 360.0f),
    .barber_pole_visible = feet <= 10000.0f,
  };
}

float KollsmanRotation(float inches_hg) {
  float const v = std::clamp(inches_hg, kKollsmanMinInHg, kKollsmanMaxInHg);
  float const normalized = (v - kKollsmanMinInHg) / (kKollsmanMaxInHg - kKollsmanMinInHg);
  return kKollsmanSweepDeg / 2.0f - kKollsmanSweepDeg * normalized;
}

float VerticalSpeedToAngle(float fpm) {
  float const v = std::clamp(fpm, -kVsiLimitFpm, kVsiLimitFpm);
  return kVsiZeroDeg + (v / kVsiLimitFpm) * kVsiSweepDeg;
}

float RpmToAngle(float rpm) {
  float const v = std::clamp(rpm, 0.0f, kTachometerMaxRpm);
  float const normalized = v / kTachometerMaxRpm;
  return SignedDegreesToPositive360(kTachometerStartDeg + kTachometerSweepDeg * normalized);
}

float TurnRateToAngle(float roll_rate) {
  float const normalized = std::clamp(roll_rate, -kMaxRollRate, kMaxRollRate) / kMaxRollRate;
  return kTwoMinuteTurnDeg * 2.0f * normalized;
}

float SlipBallAngle(float yaw) {
  float const normalized = std::clamp(yaw, -kMaxYaw, kMaxYaw) / kMaxYaw;
  return 90.0f + kInclinometerSweepDeg * normalized;
}

AttitudeDisplay ComputeAttitudeDisplay(float roll, float pitch, float cage_multiplier) {
  return AttitudeDisplay{
    .roll_deg = roll * cage_multiplier,
    .pitch_offset_px = pitch * cage_multiplier * kPitchToPixels,
  };
}

} // namespace panelkit

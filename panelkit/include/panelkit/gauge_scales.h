#pragma once

// project headers --------------------------------------
#include "panelkit/aircraft.h"

namespace panelkit {

// Value-to-needle mappings. Unless stated otherwise the result is a math angle
// in degrees, ready for PointOnCircle.

/// Speed at which the airspeed scale is half compressed.
constexpr float kAirspeedMidScale = 115.0f;
/// Clock angle of the zero/max speed mark.
constexpr float kAirspeedMaxAngle = 320.0f;

/// Throws std::invalid_argument for a speed outside [0, max_displayed_speed].
float AirspeedToAngle(float kias, AircraftLimits const& limits);

struct AltimeterNeedles final {
  float hundreds = 0.0f;
  float thousands = 0.0f;
  float ten_thousands = 0.0f;
  /// The striped warning sector shows below 10,000 ft.
  bool barber_pole_visible = true;
};

AltimeterNeedles AltitudeToNeedles(float feet);

constexpr float kKollsmanMinInHg = 28.0f;
constexpr float kKollsmanMaxInHg = 31.0f;
constexpr float kKollsmanSweepDeg = 270.0f;

/// Clockwise rotation of the barometric scale behind its window.
float KollsmanRotation(float inches_hg);

constexpr float kVsiLimitFpm = 2000.0f;
constexpr float kVsiZeroDeg = 180.0f;
constexpr float kVsiSweepDeg = 170.0f;

/// Clamped to ±kVsiLimitFpm.
float VerticalSpeedToAngle(float fpm);

constexpr float kTachometerMaxRpm = 3500.0f;
constexpr float kTachometerStartDeg = 145.0f;
constexpr float kTachometerSweepDeg = 250.0f;

/// Clamped to [0, kTachometerMaxRpm].
float RpmToAngle(float rpm);

constexpr float kMaxRollRate = 6.0f;
constexpr float kMaxYaw = 20.0f;
/// Bank of the airplane symbol at a standard-rate (2 minute) turn.
constexpr float kTwoMinuteTurnDeg = 20.0f;
constexpr float kInclinometerSweepDeg = 16.0f;

/// Clockwise rotation of the turn coordinator's airplane symbol.
float TurnRateToAngle(float roll_rate);
/// Position of the inclinometer ball along its arc.
float SlipBallAngle(float yaw);

constexpr float kPitchToPixels = 3.2f;
constexpr float kAttitudeAdjustLimitPx = kPitchToPixels * 5.0f;

struct AttitudeDisplay final {
  float roll_deg = 0.0f;
  float pitch_offset_px = 0.0f;
};

/// `cage_multiplier` goes to 0 while the gyro is caged.
AttitudeDisplay ComputeAttitudeDisplay(float roll, float pitch, float cage_multiplier);

} // namespace panelkit

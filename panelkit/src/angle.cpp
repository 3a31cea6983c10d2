// TU header --------------------------------------------
#include "panelkit/angle.h"

// c++ headers ------------------------------------------
#include <cmath>

#include <numbers>

namespace panelkit {

namespace {

constexpr float kDegToRad = std::numbers::pi_v<float> / 180.0f;
constexpr float kRadToDeg = 180.0f / std::numbers::pi_v<float>;

} // namespace

float DegToRad(float deg) {
  return deg * kDegToRad;
}
float RadToDeg(float rad) {
  return rad * kRadToDeg;
}

float SignedDegreesToPositive360(float deg) {
  float r = std::fmod(deg, 360.0f);
  if (r < 0.0f) r += 360.0f;
  // fmod of a tiny negative value can round up to exactly 360.
  if (r >= 360.0f) r = 0.0f;
  return r;
}

float ClockToMath(float clock_deg) {
  return SignedDegreesToPositive360(clock_deg + 270.0f);
}
float MathToClock(float math_deg) {
  return SignedDegreesToPositive360(math_deg + 90.0f);
}

Vec2 PointOnCircle(Vec2 const& center, float radius, float math_deg) {
  float const rad = math_deg * kDegToRad;
  return Vec2{
    center.x + radius * std::cos(rad),
    center.y + radius * std::sin(rad)
  };
}

float AngleFromCenter(Vec2 const& center, Vec2 const& point) {
  float const deg = std::atan2(point.y - center.y, point.x - center.x) * kRadToDeg;
  return SignedDegreesToPositive360(deg);
}

float AngularDelta(float from_deg, float to_deg) {
  float delta = std::fmod(to_deg - from_deg, 360.0f);
  if (delta > 180.0f) {
    delta -= 360.0f;
  }
  else if (delta < -180.0f) {
    delta += 360.0f;
  }
  return delta;
}

} // namespace panelkit

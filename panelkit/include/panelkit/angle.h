#pragma once

// project headers --------------------------------------
#include "panelkit/vec2.h"

namespace panelkit {

// Degree helpers. "Clock" angles have 0 pointing up and grow clockwise,
// "math" angles have 0 pointing along +x and grow toward +y on screen.

float DegToRad(float deg);
float RadToDeg(float rad);

/// Clock angle to math angle, in [0, 360).
float ClockToMath(float clock_deg);
/// Math angle to clock angle, in [0, 360). Exact inverse of ClockToMath.
float MathToClock(float math_deg);

/// Any angle in degrees wrapped into [0, 360).
float SignedDegreesToPositive360(float deg);

Vec2 PointOnCircle(Vec2 const& center, float radius, float math_deg);

/// Math angle of `point` seen from `center`, in [0, 360).
float AngleFromCenter(Vec2 const& center, Vec2 const& point);

/// Shortest signed difference `to - from`, in [-180, 180].
float AngularDelta(float from_deg, float to_deg);

} // namespace panelkit

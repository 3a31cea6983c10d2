// TU header --------------------------------------------
#include "primitives.h"

// c++ headers ------------------------------------------
#include <cmath>

#include <utility>

// project headers --------------------------------------
#include "panelkit/angle.h"

namespace {

constexpr int kArcSegments = 48;

} // namespace

void DrawTriangleAnyWinding(Vector2 a, Vector2 b, Vector2 c, Color color) {
  float const cross = (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
  if (cross < 0.0f) {
    std::swap(b, c);
  }
  DrawTriangle(a, b, c, color);
}

raylib::Vector2 PointOnCircle(raylib::Vector2 const& center, float radius, float math_deg) {
  return ToScreen(panelkit::PointOnCircle(ToPanel(center), radius, math_deg));
}

void DrawFace(raylib::Vector2 const& center, float radius) {
  DrawCircleV(center, radius, Color{ 70, 72, 76, 255 });
  DrawCircleV(center, radius * 0.96f, Color{ 28, 28, 30, 255 });
  DrawCircleV(center, radius * 0.92f, Color{ 12, 12, 12, 255 });
}

void DrawTick(
  raylib::Vector2 const& center,
  float outer_radius,
  float length,
  float math_deg,
  float thick,
  Color color
) {
  raylib::Vector2 const outer = PointOnCircle(center, outer_radius, math_deg);
  raylib::Vector2 const inner = PointOnCircle(center, outer_radius - length, math_deg);
  DrawLineEx(inner, outer, thick, color);
}

void DrawClockArc(
  raylib::Vector2 const& center,
  float inner_radius,
  float outer_radius,
  float from_clock_deg,
  float to_clock_deg,
  Color color
) {
  // raylib measures ring angles like math angles, which run clockwise on screen.
  float start = from_clock_deg - 90.0f;
  float end = to_clock_deg - 90.0f;
  if (end < start) {
    end += 360.0f;
  }
  DrawRing(center, inner_radius, outer_radius, start, end, kArcSegments, color);
}

void DrawBarberPole(
  raylib::Vector2 const& center,
  float inner_radius,
  float outer_radius,
  float from_clock_deg,
  float to_clock_deg,
  float alpha
) {
  if (alpha <= 0.0f) {
    return;
  }

  constexpr int kStripes = 8;

  float sweep = to_clock_deg - from_clock_deg;
  if (sweep < 0.0f) {
    sweep += 360.0f;
  }
  float const stripe = sweep / float(kStripes);
  for (int i = 0; i < kStripes; ++i) {
    Color const color = (i % 2 == 0) ? RED : RAYWHITE;
    float const start = from_clock_deg + stripe * float(i);
    DrawClockArc(center, inner_radius, outer_radius, start, start + stripe, Fade(color, alpha));
  }
}

void DrawNeedle(
  raylib::Vector2 const& center,
  float length,
  float tail,
  float width,
  float math_deg,
  Color color
) {
  raylib::Vector2 const tip = PointOnCircle(center, length, math_deg);
  raylib::Vector2 const back = PointOnCircle(center, tail, math_deg + 180.0f);
  raylib::Vector2 const left = PointOnCircle(center, width * 0.5f, math_deg - 90.0f);
  raylib::Vector2 const right = PointOnCircle(center, width * 0.5f, math_deg + 90.0f);

  DrawTriangleAnyWinding(tip, left, right, color);
  DrawTriangleAnyWinding(back, right, left, color);
  DrawCircleV(center, width * 0.75f, Color{ 40, 40, 40, 255 });
}

void DrawTextCentered(char const* text, raylib::Vector2 const& position, float size, Color color) {
  float const spacing = size / 10.0f;
  raylib::Vector2 const extent = MeasureTextEx(GetFontDefault(), text, size, spacing);
  DrawTextEx(GetFontDefault(), text, position - extent * 0.5f, size, spacing, color);
}

void DrawTextRotated(
  char const* text,
  raylib::Vector2 const& position,
  float size,
  float rotation_deg,
  Color color
) {
  float const spacing = size / 10.0f;
  raylib::Vector2 const extent = MeasureTextEx(GetFontDefault(), text, size, spacing);
  DrawTextPro(GetFontDefault(), text, position, extent * 0.5f, rotation_deg, size, spacing, color);
}

void DrawAirplaneSymbol(raylib::Vector2 const& center, float span, float rotation_deg, Color color) {
  float const rad = panelkit::DegToRad(rotation_deg);
  raylib::Vector2 const right{ std::cos(rad), std::sin(rad) };
  raylib::Vector2 const up{ right.y, -right.x };

  float const half_span = span * 0.5f;
  float const thick = span / 28.0f;

  DrawLineEx(center - right * half_span, center - right * (span * 0.08f), thick, color);
  DrawLineEx(center + right * (span * 0.08f), center + right * half_span, thick, color);
  DrawCircleV(center, span * 0.05f, color);
  DrawLineEx(center + up * (span * 0.05f), center + up * (span * 0.14f), thick, color);
}

void DrawDialNumbers(
  raylib::Vector2 const& center,
  float radius,
  float from_clock_deg,
  float step_deg,
  int count,
  int first,
  int step,
  float size,
  Color color
) {
  for (int i = 0; i < count; ++i) {
    float const clock = from_clock_deg + step_deg * float(i);
    raylib::Vector2 const at = PointOnCircle(center, radius, panelkit::ClockToMath(clock));
    DrawTextCentered(TextFormat("%i", first + step * i), at, size, color);
  }
}

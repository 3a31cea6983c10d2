#pragma once

// external headers -------------------------------------
#include "raylib.h"
#include "raylib-cpp.hpp"

// project headers --------------------------------------
#include "panelkit/vec2.h"

// Drawing helpers for instrument faces. Angles named `clock_deg` have 0 up and
// grow clockwise, `math_deg` have 0 along +x.

inline raylib::Vector2 ToScreen(panelkit::Vec2 const& v) {
  return raylib::Vector2{ v.x, v.y };
}

inline panelkit::Vec2 ToPanel(Vector2 const& v) {
  return panelkit::Vec2{ v.x, v.y };
}

/// raylib culls triangles wound the wrong way; this one draws either winding.
void DrawTriangleAnyWinding(Vector2 a, Vector2 b, Vector2 c, Color color);

raylib::Vector2 PointOnCircle(raylib::Vector2 const& center, float radius, float math_deg);

/// Round black face with a metal bezel.
void DrawFace(raylib::Vector2 const& center, float radius);

void DrawTick(
  raylib::Vector2 const& center,
  float outer_radius,
  float length,
  float math_deg,
  float thick,
  Color color
);

/// Band between two radii, swept clockwise from `from_clock_deg` to `to_clock_deg`.
void DrawClockArc(
  raylib::Vector2 const& center,
  float inner_radius,
  float outer_radius,
  float from_clock_deg,
  float to_clock_deg,
  Color color
);

/// Alternating red and white sectors.
void DrawBarberPole(
  raylib::Vector2 const& center,
  float inner_radius,
  float outer_radius,
  float from_clock_deg,
  float to_clock_deg,
  float alpha
);

/// Tapered needle pointing at `math_deg`, with a short counterweight tail.
void DrawNeedle(
  raylib::Vector2 const& center,
  float length,
  float tail,
  float width,
  float math_deg,
  Color color
);

void DrawTextCentered(char const* text, raylib::Vector2 const& position, float size, Color color);

/// Rotated about the text center.
void DrawTextRotated(
  char const* text,
  raylib::Vector2 const& position,
  float size,
  float rotation_deg,
  Color color
);

/// Front view: wings, fuselage dot and fin. `rotation_deg` banks clockwise.
void DrawAirplaneSymbol(raylib::Vector2 const& center, float span, float rotation_deg, Color color);

/// Upright numbers around a dial: `count` labels starting at `first`, each
/// `step` larger and `step_deg` further clockwise.
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
);

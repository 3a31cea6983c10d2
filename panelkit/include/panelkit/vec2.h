#pragma once

namespace panelkit {

/// Point or offset in screen space (y grows downward).
struct Vec2 final {
  float x = 0.0f;
  float y = 0.0f;

  Vec2 operator+(Vec2 const& other) const { return Vec2{ x + other.x, y + other.y }; }
  Vec2 operator-(Vec2 const& other) const { return Vec2{ x - other.x, y - other.y }; }
  Vec2 operator*(float scalar) const { return Vec2{ x * scalar, y * scalar }; }
  Vec2 operator-() const { return Vec2{ -x, -y }; }
  Vec2& operator+=(Vec2 const& other) { x += other.x; y += other.y; return *this; }
  Vec2& operator-=(Vec2 const& other) { x -= other.x; y -= other.y; return *this; }
  bool operator==(Vec2 const& other) const { return x == other.x && y == other.y; }
  bool operator!=(Vec2 const& other) const { return !(*this == other); }

  float LengthSquared() const { return x * x + y * y; }

  friend Vec2 operator*(float scalar, Vec2 const& v) { return v * scalar; }
};

} // namespace panelkit

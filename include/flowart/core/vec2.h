#pragma once
#include <cmath>

namespace flowart {

// 2D point/vector in canvas pixel units.
struct Vec2 {
  double x{0.0};
  double y{0.0};

  Vec2() = default;
  Vec2(double x_, double y_) : x(x_), y(y_) {}

  Vec2 operator+(const Vec2& rhs) const { return {x + rhs.x, y + rhs.y}; }
  Vec2 operator-(const Vec2& rhs) const { return {x - rhs.x, y - rhs.y}; }
  Vec2 operator*(double s) const { return {x * s, y * s}; }

  // Exact equality; stroke positions are compared bit-for-bit in determinism checks.
  bool operator==(const Vec2& rhs) const { return x == rhs.x && y == rhs.y; }
  bool operator!=(const Vec2& rhs) const { return !(*this == rhs); }

  double dot(const Vec2& rhs) const { return x * rhs.x + y * rhs.y; }
  double length() const { return std::sqrt(x * x + y * y); }
};

} // namespace flowart

#include "flowart/core/canvas.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace flowart {

Canvas::Canvas(int width, int height, Rgb background)
    : width_(std::max(0, width)),
      height_(std::max(0, height)),
      pixels_(static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_) * 3u) {
  for (std::size_t k = 0; k < pixels_.size(); k += 3) {
    pixels_[k] = background.r;
    pixels_[k + 1] = background.g;
    pixels_[k + 2] = background.b;
  }
}

Rgb Canvas::pixel(int x, int y) const {
  if (x < 0 || y < 0 || x >= width_ || y >= height_) return Rgb{};
  const std::size_t k = (static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) + x) * 3u;
  return Rgb{pixels_[k], pixels_[k + 1], pixels_[k + 2]};
}

void Canvas::set_pixel(int x, int y, Rgb c) {
  if (x < 0 || y < 0 || x >= width_ || y >= height_) return;
  const std::size_t k = (static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) + x) * 3u;
  pixels_[k] = c.r;
  pixels_[k + 1] = c.g;
  pixels_[k + 2] = c.b;
}

void Canvas::draw_segment(const Vec2& a, const Vec2& b, int width, Rgb color) {
  if (!std::isfinite(a.x) || !std::isfinite(a.y) || !std::isfinite(b.x) || !std::isfinite(b.y)) return;
  if (width < 2) {
    draw_thin(a, b, color);
  } else {
    draw_wide(a, b, width, color);
  }
}

void Canvas::draw_thin(const Vec2& a, const Vec2& b, Rgb color) {
  long x0 = std::lround(a.x);
  long y0 = std::lround(a.y);
  const long x1 = std::lround(b.x);
  const long y1 = std::lround(b.y);

  const long dx = std::labs(x1 - x0);
  const long dy = -std::labs(y1 - y0);
  const long sx = x0 < x1 ? 1 : -1;
  const long sy = y0 < y1 ? 1 : -1;
  long err = dx + dy;

  for (;;) {
    set_pixel(static_cast<int>(x0), static_cast<int>(y0), color);
    if (x0 == x1 && y0 == y1) break;
    const long e2 = 2 * err;
    if (e2 >= dy) {
      err += dy;
      x0 += sx;
    }
    if (e2 <= dx) {
      err += dx;
      y0 += sy;
    }
  }
}

void Canvas::draw_wide(const Vec2& a, const Vec2& b, int width, Rgb color) {
  const double half = width / 2.0;
  const Vec2 d = b - a;
  const double len = d.length();

  if (len < 1e-12) {
    const int cx = static_cast<int>(std::lround(a.x));
    const int cy = static_cast<int>(std::lround(a.y));
    const int lo = -width / 2;
    for (int y = cy + lo; y < cy + lo + width; ++y) {
      for (int x = cx + lo; x < cx + lo + width; ++x) set_pixel(x, y, color);
    }
    return;
  }

  const Vec2 u = d * (1.0 / len);
  const Vec2 n{-u.y, u.x};
  const Vec2 corners[4] = {a + n * half, a - n * half, b + n * half, b - n * half};

  double min_x = corners[0].x, max_x = corners[0].x;
  double min_y = corners[0].y, max_y = corners[0].y;
  for (const Vec2& c : corners) {
    min_x = std::min(min_x, c.x);
    max_x = std::max(max_x, c.x);
    min_y = std::min(min_y, c.y);
    max_y = std::max(max_y, c.y);
  }

  const int px0 = std::max(0, static_cast<int>(std::floor(min_x)));
  const int py0 = std::max(0, static_cast<int>(std::floor(min_y)));
  const int px1 = std::min(width_ - 1, static_cast<int>(std::ceil(max_x)));
  const int py1 = std::min(height_ - 1, static_cast<int>(std::ceil(max_y)));

  // Half-open in both directions so an axis-aligned segment of width w covers
  // exactly w pixel rows and consecutive segments do not overlap at joints.
  for (int y = py0; y <= py1; ++y) {
    for (int x = px0; x <= px1; ++x) {
      const Vec2 rel{x - a.x, y - a.y};
      const double along = rel.dot(u);
      const double across = rel.dot(n);
      if (along >= 0.0 && along < len && across >= -half && across < half) set_pixel(x, y, color);
    }
  }
}

} // namespace flowart

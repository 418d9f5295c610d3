#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "flowart/core/config.h"
#include "flowart/core/vec2.h"

namespace flowart {

// Row-major 8-bit RGB raster: width * height * 3 bytes.
//
// A render creates one Canvas, draws into it sequentially and hands it back to
// the caller by move. Pixel (x, y) has its center at integer coordinates
// (x, y); anything drawn outside the raster is clipped.
class Canvas {
 public:
  Canvas() = default;
  Canvas(int width, int height, Rgb background);

  int width() const { return width_; }
  int height() const { return height_; }
  bool empty() const { return pixels_.empty(); }

  const std::vector<std::uint8_t>& pixels() const { return pixels_; }

  Rgb pixel(int x, int y) const;
  void set_pixel(int x, int y, Rgb c);

  // Straight segment from a to b.
  //
  // A width below 2 draws a 1-pixel Bresenham line between the rounded
  // endpoints. Wider segments fill every pixel whose center lies in the
  // rectangle of the given width around the segment (flat ends, no caps).
  void draw_segment(const Vec2& a, const Vec2& b, int width, Rgb color);

  bool operator==(const Canvas& o) const {
    return width_ == o.width_ && height_ == o.height_ && pixels_ == o.pixels_;
  }
  bool operator!=(const Canvas& o) const { return !(*this == o); }

 private:
  void draw_thin(const Vec2& a, const Vec2& b, Rgb color);
  void draw_wide(const Vec2& a, const Vec2& b, int width, Rgb color);

  int width_{0};
  int height_{0};
  std::vector<std::uint8_t> pixels_;
};

} // namespace flowart

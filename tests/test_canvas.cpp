#include <iostream>

#include "flowart/core/canvas.h"

#define FLOWART_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

int count_color(const flowart::Canvas& c, flowart::Rgb color) {
  int n = 0;
  for (int y = 0; y < c.height(); ++y) {
    for (int x = 0; x < c.width(); ++x) {
      if (c.pixel(x, y) == color) ++n;
    }
  }
  return n;
}

} // namespace

int test_canvas() {
  const flowart::Rgb bg{250, 250, 245};
  const flowart::Rgb ink{10, 20, 30};

  // Background fill and layout.
  {
    const flowart::Canvas c(7, 3, bg);
    FLOWART_ASSERT(c.width() == 7 && c.height() == 3);
    FLOWART_ASSERT(c.pixels().size() == 7u * 3u * 3u);
    FLOWART_ASSERT(count_color(c, bg) == 21);
    FLOWART_ASSERT(!c.empty());
    FLOWART_ASSERT(flowart::Canvas().empty());
  }

  // Thin horizontal segment covers both endpoints.
  {
    flowart::Canvas c(10, 10, bg);
    c.draw_segment(flowart::Vec2(0.0, 0.0), flowart::Vec2(4.0, 0.0), 1, ink);
    FLOWART_ASSERT(count_color(c, ink) == 5);
    for (int x = 0; x <= 4; ++x) FLOWART_ASSERT(c.pixel(x, 0) == ink);
  }

  // Thin diagonal: one pixel per step, endpoints rounded.
  {
    flowart::Canvas c(10, 10, bg);
    c.draw_segment(flowart::Vec2(1.2, 0.8), flowart::Vec2(5.4, 4.6), 0, ink);
    FLOWART_ASSERT(count_color(c, ink) == 5);
    FLOWART_ASSERT(c.pixel(1, 1) == ink);
    FLOWART_ASSERT(c.pixel(5, 5) == ink);
  }

  // Wide segment fills a width x length block with flat ends.
  {
    flowart::Canvas c(32, 32, bg);
    c.draw_segment(flowart::Vec2(10.0, 10.0), flowart::Vec2(20.0, 10.0), 4, ink);
    FLOWART_ASSERT(count_color(c, ink) == 40);
    for (int y = 8; y <= 11; ++y) {
      for (int x = 10; x <= 19; ++x) FLOWART_ASSERT(c.pixel(x, y) == ink);
    }
    FLOWART_ASSERT(c.pixel(20, 10) == bg);
    FLOWART_ASSERT(c.pixel(10, 12) == bg);
  }

  // Zero-length wide segment stamps a square.
  {
    flowart::Canvas c(16, 16, bg);
    c.draw_segment(flowart::Vec2(8.0, 8.0), flowart::Vec2(8.0, 8.0), 3, ink);
    FLOWART_ASSERT(count_color(c, ink) == 9);
  }

  // Drawing off the raster is clipped, never out of range.
  {
    flowart::Canvas c(8, 8, bg);
    c.draw_segment(flowart::Vec2(-20.0, 4.0), flowart::Vec2(30.0, 4.0), 1, ink);
    FLOWART_ASSERT(count_color(c, ink) == 8);
    c.draw_segment(flowart::Vec2(-5.0, -5.0), flowart::Vec2(-1.0, -9.0), 6, ink);
    FLOWART_ASSERT(count_color(c, ink) == 8);
    c.set_pixel(8, 0, bg);
    c.set_pixel(-1, 0, bg);
    FLOWART_ASSERT((c.pixel(100, 100) == flowart::Rgb{}));
  }

  return 0;
}

#include <cstdlib>
#include <iostream>

#include "flowart/core/colormap.h"
#include "flowart/core/errors.h"

#define FLOWART_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool near_rgb(const flowart::Rgb& a, const flowart::Rgb& b, int tol) {
  return std::abs(int(a.r) - int(b.r)) <= tol && std::abs(int(a.g) - int(b.g)) <= tol &&
         std::abs(int(a.b) - int(b.b)) <= tol;
}

flowart::Rgb at(const char* name, double x) { return flowart::to_rgb8(flowart::evaluate_colormap(name, x)); }

} // namespace

int test_colormap() {
  using flowart::Rgb;

  // Endpoints and truncating channel conversion.
  FLOWART_ASSERT((at("grey", 0.0) == Rgb{0, 0, 0}));
  FLOWART_ASSERT((at("grey", 1.0) == Rgb{255, 255, 255}));
  FLOWART_ASSERT((at("grey", 0.5) == Rgb{127, 127, 127}));
  FLOWART_ASSERT((at("hot", 0.0) == Rgb{10, 0, 0}));
  FLOWART_ASSERT((at("hot", 1.0) == Rgb{255, 255, 255}));
  FLOWART_ASSERT((at("bone", 0.0) == Rgb{0, 0, 0}));
  FLOWART_ASSERT((at("bone", 1.0) == Rgb{255, 255, 255}));
  FLOWART_ASSERT((at("rainbow", 0.0) == Rgb{127, 0, 255}));
  FLOWART_ASSERT((at("rainbow", 1.0) == Rgb{255, 0, 0}));
  FLOWART_ASSERT(near_rgb(at("PuBu", 0.0), Rgb{255, 247, 251}, 1));
  FLOWART_ASSERT(near_rgb(at("PuBu", 1.0), Rgb{2, 56, 88}, 1));
  FLOWART_ASSERT(near_rgb(at("RdPu", 1.0), Rgb{73, 0, 106}, 1));
  FLOWART_ASSERT(near_rgb(at("cividis", 0.0), Rgb{0, 34, 78}, 1));

  // Positions outside [0, 1] clamp.
  FLOWART_ASSERT((at("grey", -3.0) == at("grey", 0.0)));
  FLOWART_ASSERT((at("hot", 7.0) == at("hot", 1.0)));

  // Names are case-insensitive; "gray" is accepted.
  FLOWART_ASSERT(flowart::is_known_colormap("pubu"));
  FLOWART_ASSERT(flowart::is_known_colormap("GRAY"));
  FLOWART_ASSERT(!flowart::is_known_colormap("viridis"));
  FLOWART_ASSERT((at("gray", 0.25) == at("grey", 0.25)));
  FLOWART_ASSERT(flowart::colormap_names().size() == 7);
  for (const std::string& name : flowart::colormap_names()) FLOWART_ASSERT(flowart::is_known_colormap(name));

  {
    bool threw = false;
    try {
      (void)flowart::evaluate_colormap("viridis", 0.5);
    } catch (const flowart::ConfigurationError& e) {
      threw = true;
      FLOWART_ASSERT(e.field() == "colormap");
      FLOWART_ASSERT(e.value() == "viridis");
    }
    FLOWART_ASSERT(threw);
  }

  // LUT sampling covers [start, end] inclusively.
  {
    const flowart::ColorLut lut = flowart::sample_lut("grey", 0.0, 1.0, 256);
    FLOWART_ASSERT(lut.size() == 256);
    FLOWART_ASSERT((lut.front() == Rgb{0, 0, 0}));
    FLOWART_ASSERT((lut.back() == Rgb{255, 255, 255}));
    for (std::size_t i = 1; i < lut.size(); ++i) FLOWART_ASSERT(lut[i].r >= lut[i - 1].r);

    const flowart::ColorLut part = flowart::sample_lut("hot", 0.2, 0.9, 5);
    FLOWART_ASSERT(part.size() == 5);
    FLOWART_ASSERT((part.front() == at("hot", 0.2)));
    FLOWART_ASSERT((part.back() == at("hot", 0.9)));

    const flowart::ColorLut one = flowart::sample_lut("bone", 0.4, 0.9, 1);
    FLOWART_ASSERT(one.size() == 1);
    FLOWART_ASSERT((one[0] == at("bone", 0.4)));
    FLOWART_ASSERT(flowart::sample_lut("bone", 0.0, 1.0, 0).empty());
  }

  return 0;
}

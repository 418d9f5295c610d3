#include "flowart/core/colormap.h"

#include <algorithm>
#include <cmath>
#include <cstdint>

#include "flowart/core/errors.h"
#include "flowart/util/strings.h"

namespace flowart {
namespace {

constexpr double kPi = 3.14159265358979323846;

struct Stop {
  double x;
  double y;
};

using Channel = std::vector<Stop>;

struct SegmentMap {
  Channel r;
  Channel g;
  Channel b;
};

double eval_channel(const Channel& ch, double x) {
  if (ch.empty()) return 0.0;
  if (x <= ch.front().x) return ch.front().y;
  for (std::size_t i = 1; i < ch.size(); ++i) {
    if (x <= ch[i].x) {
      const Stop& a = ch[i - 1];
      const Stop& b = ch[i];
      const double span = b.x - a.x;
      if (span <= 0.0) return b.y;
      return a.y + (b.y - a.y) * ((x - a.x) / span);
    }
  }
  return ch.back().y;
}

// Evenly spaced hex stops (ColorBrewer style sequential ramps).
SegmentMap from_hex_stops(const std::vector<std::uint32_t>& hex) {
  SegmentMap m;
  const double n = static_cast<double>(hex.size() - 1);
  for (std::size_t i = 0; i < hex.size(); ++i) {
    const double x = static_cast<double>(i) / n;
    m.r.push_back({x, static_cast<double>((hex[i] >> 16) & 0xFF) / 255.0});
    m.g.push_back({x, static_cast<double>((hex[i] >> 8) & 0xFF) / 255.0});
    m.b.push_back({x, static_cast<double>(hex[i] & 0xFF) / 255.0});
  }
  return m;
}

const SegmentMap& bone_map() {
  static const SegmentMap m{
      {{0.0, 0.0}, {0.746032, 0.652778}, {1.0, 1.0}},
      {{0.0, 0.0}, {0.365079, 0.319444}, {0.746032, 0.777778}, {1.0, 1.0}},
      {{0.0, 0.0}, {0.365079, 0.444444}, {1.0, 1.0}},
  };
  return m;
}

const SegmentMap& hot_map() {
  static const SegmentMap m{
      {{0.0, 0.0416}, {0.365079, 1.0}, {1.0, 1.0}},
      {{0.0, 0.0}, {0.365079, 0.0}, {0.746032, 1.0}, {1.0, 1.0}},
      {{0.0, 0.0}, {0.746032, 0.0}, {1.0, 1.0}},
  };
  return m;
}

const SegmentMap& pubu_map() {
  static const SegmentMap m = from_hex_stops(
      {0xfff7fb, 0xece7f2, 0xd0d1e6, 0xa6bddb, 0x74a9cf, 0x3690c0, 0x0570b0, 0x045a8d, 0x023858});
  return m;
}

const SegmentMap& rdpu_map() {
  static const SegmentMap m = from_hex_stops(
      {0xfff7f3, 0xfde0dd, 0xfcc5c0, 0xfa9fb5, 0xf768a1, 0xdd3497, 0xae017e, 0x7a0177, 0x49006a});
  return m;
}

// Nine-stop approximation of cividis (dark blue through grey to yellow).
const SegmentMap& cividis_map() {
  static const SegmentMap m = from_hex_stops(
      {0x00224e, 0x123570, 0x3b496c, 0x575d6d, 0x707173, 0x8a8779, 0xa69d75, 0xc4b56c, 0xfee838});
  return m;
}

const SegmentMap& grey_map() {
  static const SegmentMap m{
      {{0.0, 0.0}, {1.0, 1.0}},
      {{0.0, 0.0}, {1.0, 1.0}},
      {{0.0, 0.0}, {1.0, 1.0}},
  };
  return m;
}

ColorF eval_segments(const SegmentMap& m, double x) {
  return ColorF{eval_channel(m.r, x), eval_channel(m.g, x), eval_channel(m.b, x)};
}

ColorF eval_rainbow(double x) {
  ColorF c;
  c.r = std::clamp(std::fabs(2.0 * x - 0.5), 0.0, 1.0);
  c.g = std::clamp(std::sin(kPi * x), 0.0, 1.0);
  c.b = std::clamp(std::cos(kPi * x * 0.5), 0.0, 1.0);
  return c;
}

} // namespace

const std::vector<std::string>& colormap_names() {
  static const std::vector<std::string> names = {"bone", "hot", "PuBu", "RdPu", "rainbow", "cividis", "grey"};
  return names;
}

bool is_known_colormap(const std::string& name) {
  const std::string n = to_lower(name);
  if (n == "gray") return true;
  for (const std::string& k : colormap_names()) {
    if (to_lower(k) == n) return true;
  }
  return false;
}

ColorF evaluate_colormap(const std::string& name, double x) {
  if (!std::isfinite(x)) x = 0.0;
  x = std::clamp(x, 0.0, 1.0);

  const std::string n = to_lower(name);
  if (n == "bone") return eval_segments(bone_map(), x);
  if (n == "hot") return eval_segments(hot_map(), x);
  if (n == "pubu") return eval_segments(pubu_map(), x);
  if (n == "rdpu") return eval_segments(rdpu_map(), x);
  if (n == "rainbow") return eval_rainbow(x);
  if (n == "cividis") return eval_segments(cividis_map(), x);
  if (n == "grey" || n == "gray") return eval_segments(grey_map(), x);

  throw ConfigurationError("colormap", name, "unknown colormap '" + name + "'");
}

Rgb to_rgb8(const ColorF& c) {
  auto ch = [](double v) {
    const int i = static_cast<int>(std::clamp(v, 0.0, 1.0) * 255.0);
    return static_cast<std::uint8_t>(std::clamp(i, 0, 255));
  };
  return Rgb{ch(c.r), ch(c.g), ch(c.b)};
}

ColorLut sample_lut(const std::string& name, double start, double end, int n) {
  if (!is_known_colormap(name)) {
    throw ConfigurationError("colormap", name, "unknown colormap '" + name + "'");
  }
  ColorLut lut;
  if (n <= 0) return lut;
  lut.reserve(static_cast<std::size_t>(n));
  for (int i = 0; i < n; ++i) {
    const double t = (n == 1) ? 0.0 : static_cast<double>(i) / static_cast<double>(n - 1);
    lut.push_back(to_rgb8(evaluate_colormap(name, start + (end - start) * t)));
  }
  return lut;
}

} // namespace flowart

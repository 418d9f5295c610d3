#include "flowart/util/digest.h"

#include <cstdint>
#include <cstring>
#include <sstream>
#include <string>
#include <type_traits>

namespace flowart {
namespace {

// FNV-1a 64-bit.
class Digest64 {
 public:
  Digest64() = default;

  void add_u8(std::uint8_t b) {
    h_ ^= static_cast<std::uint64_t>(b);
    h_ *= kPrime;
  }

  void add_u64(std::uint64_t v) {
    // Feed little-endian bytes to avoid host endianness differences.
    for (int i = 0; i < 8; ++i) {
      add_u8(static_cast<std::uint8_t>((v >> (i * 8)) & 0xFFu));
    }
  }

  void add_i64(std::int64_t v) { add_u64(static_cast<std::uint64_t>(v)); }

  void add_size(std::size_t n) { add_u64(static_cast<std::uint64_t>(n)); }

  void add_bool(bool b) { add_u8(static_cast<std::uint8_t>(b ? 1 : 0)); }

  template <typename E, typename = std::enable_if_t<std::is_enum_v<E>>>
  void add_enum(E e) {
    using U = std::underlying_type_t<E>;
    add_u64(static_cast<std::uint64_t>(static_cast<U>(e)));
  }

  void add_string(const std::string& s) {
    add_size(s.size());
    for (unsigned char c : s) add_u8(static_cast<std::uint8_t>(c));
  }

  void add_double(double v) {
    std::uint64_t u = 0;
    static_assert(sizeof(u) == sizeof(v));
    std::memcpy(&u, &v, sizeof(u));

    // Normalize -0.0 to +0.0.
    if ((u << 1) == 0) u = 0;

    // Canonicalize NaNs so different payloads don't change the digest.
    const std::uint64_t exp = u & 0x7ff0000000000000ULL;
    const std::uint64_t mant = u & 0x000fffffffffffffULL;
    if (exp == 0x7ff0000000000000ULL && mant != 0) {
      u = 0x7ff8000000000000ULL;
    }

    add_u64(u);
  }

  void add_rgb(const Rgb& c) {
    add_u8(c.r);
    add_u8(c.g);
    add_u8(c.b);
  }

  std::uint64_t value() const { return h_; }

 private:
  static constexpr std::uint64_t kOffset = 1469598103934665603ull;
  static constexpr std::uint64_t kPrime = 1099511628211ull;

  std::uint64_t h_{kOffset};
};

} // namespace

std::uint64_t digest_canvas64(const Canvas& canvas) {
  Digest64 d;
  d.add_i64(canvas.width());
  d.add_i64(canvas.height());
  for (std::uint8_t b : canvas.pixels()) d.add_u8(b);
  return d.value();
}

std::uint64_t digest_config64(const Configuration& cfg) {
  Digest64 d;
  d.add_i64(cfg.width);
  d.add_i64(cfg.height);
  d.add_i64(cfg.cell_size);
  d.add_double(cfg.margin_factor);
  d.add_double(cfg.noise_scale);
  d.add_i64(cfg.octaves);
  d.add_bool(cfg.seed.has_value());
  if (cfg.seed) d.add_i64(*cfg.seed);
  d.add_double(cfg.swirl);
  d.add_i64(cfg.quantize_steps);
  d.add_enum(cfg.seeding);
  d.add_double(cfg.density);
  d.add_i64(cfg.max_length);
  d.add_double(cfg.step_size);
  d.add_double(cfg.angle_gain);
  d.add_double(cfg.jitter);
  d.add_size(cfg.color_lut.size());
  for (const Rgb& c : cfg.color_lut) d.add_rgb(c);
  d.add_enum(cfg.palette_axis);
  d.add_double(cfg.palette_within_stroke);
  d.add_bool(cfg.color_start.has_value());
  if (cfg.color_start) d.add_rgb(*cfg.color_start);
  d.add_bool(cfg.color_end.has_value());
  if (cfg.color_end) d.add_rgb(*cfg.color_end);
  d.add_string(cfg.palette_name);
  d.add_double(cfg.width_start);
  d.add_double(cfg.width_end);
  d.add_rgb(cfg.background);
  return d.value();
}

std::string digest64_to_hex(std::uint64_t v) {
  std::ostringstream out;
  out << std::hex;
  out.width(16);
  out.fill('0');
  out << v;
  return out.str();
}

} // namespace flowart

#include <iostream>
#include <string>

#include "flowart/util/digest.h"

#define FLOWART_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

int test_digest() {
  // Hex formatting is fixed width and lowercase.
  FLOWART_ASSERT(flowart::digest64_to_hex(0) == "0000000000000000");
  FLOWART_ASSERT(flowart::digest64_to_hex(0xDEADBEEFULL) == "00000000deadbeef");
  FLOWART_ASSERT(flowart::digest64_to_hex(~0ULL).size() == 16);

  // Canvas digests track pixels and dimensions.
  {
    flowart::Canvas a(4, 4, flowart::Rgb{10, 10, 10});
    flowart::Canvas b(4, 4, flowart::Rgb{10, 10, 10});
    FLOWART_ASSERT(flowart::digest_canvas64(a) == flowart::digest_canvas64(b));

    b.set_pixel(3, 3, flowart::Rgb{10, 10, 11});
    FLOWART_ASSERT(flowart::digest_canvas64(a) != flowart::digest_canvas64(b));

    // Same bytes, different shape.
    const flowart::Canvas wide(8, 2, flowart::Rgb{10, 10, 10});
    FLOWART_ASSERT(flowart::digest_canvas64(a) != flowart::digest_canvas64(wide));
  }

  // Config digests cover every field, including optionals and the LUT.
  {
    flowart::Configuration a;
    a.width = 100;
    a.height = 100;
    a.color_lut = {flowart::Rgb{1, 1, 1}};
    flowart::Configuration b = a;
    FLOWART_ASSERT(flowart::digest_config64(a) == flowart::digest_config64(b));

    b.seed = 0;
    FLOWART_ASSERT(flowart::digest_config64(a) != flowart::digest_config64(b));
    b = a;
    b.color_lut.push_back(flowart::Rgb{2, 2, 2});
    FLOWART_ASSERT(flowart::digest_config64(a) != flowart::digest_config64(b));
    b = a;
    b.palette_axis = flowart::PaletteAxis::Random;
    FLOWART_ASSERT(flowart::digest_config64(a) != flowart::digest_config64(b));
    b = a;
    b.jitter = 1e-12;
    FLOWART_ASSERT(flowart::digest_config64(a) != flowart::digest_config64(b));

    // -0.0 and 0.0 are the same value.
    b = a;
    b.swirl = -0.0;
    FLOWART_ASSERT(flowart::digest_config64(a) == flowart::digest_config64(b));
  }

  return 0;
}

#pragma once

#include <cstddef>
#include <vector>

namespace flowart {

// Dense row-major 2D array of doubles. Used for the noise field and the angle
// field, which always share one shape.
struct ScalarGrid {
  int rows{0};
  int cols{0};
  std::vector<double> values;

  ScalarGrid() = default;
  ScalarGrid(int rows_, int cols_, double fill = 0.0)
      : rows(rows_), cols(cols_), values(static_cast<std::size_t>(rows_) * static_cast<std::size_t>(cols_), fill) {}

  bool contains(int r, int c) const { return r >= 0 && r < rows && c >= 0 && c < cols; }

  double at(int r, int c) const { return values[static_cast<std::size_t>(r) * static_cast<std::size_t>(cols) + c]; }
  double& at(int r, int c) { return values[static_cast<std::size_t>(r) * static_cast<std::size_t>(cols) + c]; }
};

} // namespace flowart

#pragma once

#include <cstddef>
#include <string>
#include <tuple>

namespace qsurf {

// Integer (row, col) site on the rotated lattice.
struct Coordinate {
  std::size_t row = 0;
  std::size_t col = 0;
};

inline bool operator==(const Coordinate& a, const Coordinate& b) {
  return a.row == b.row && a.col == b.col;
}

inline bool operator!=(const Coordinate& a, const Coordinate& b) { return !(a == b); }

// Row-major order, the order in which the lattice is scanned.
inline bool operator<(const Coordinate& a, const Coordinate& b) {
  return std::tie(a.row, a.col) < std::tie(b.row, b.col);
}

inline std::string to_string(const Coordinate& c) {
  return "(" + std::to_string(c.row) + ", " + std::to_string(c.col) + ")";
}

}  // namespace qsurf

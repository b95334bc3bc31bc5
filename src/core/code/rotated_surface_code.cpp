#include "qsurf/core/code/rotated_surface_code.h"

#include <cstddef>
#include <utility>
#include <vector>

#include "qsurf/core/errors.h"

namespace qsurf {

namespace {

// Dense occupancy grid over [0, 2d] x [0, 2d] used while growing stabilizer supports.
class SiteGrid {
 public:
  explicit SiteGrid(std::size_t distance)
      : stride_(2 * distance + 1), is_data_(stride_ * stride_, false) {}

  void mark_data(const Coordinate& c) { is_data_[c.row * stride_ + c.col] = true; }

  // True when (row, col) is in bounds and holds a data qubit.
  bool has_data(std::ptrdiff_t row, std::ptrdiff_t col) const noexcept {
    if (row < 0 || col < 0 || static_cast<std::size_t>(row) >= stride_ ||
        static_cast<std::size_t>(col) >= stride_) {
      return false;
    }
    return is_data_[static_cast<std::size_t>(row) * stride_ + static_cast<std::size_t>(col)];
  }

 private:
  std::size_t stride_;
  std::vector<bool> is_data_;
};

void build_sites(Lattice* lattice) {
  const std::size_t d = lattice->distance;
  std::vector<LatticeSite>& sites = lattice->sites;
  sites.reserve(2 * d * d - 1);

  // Data qubits live on odd lattice coordinates.
  for (std::size_t row = 1; row < 2 * d + 1; row += 2) {
    for (std::size_t col = 1; col < 2 * d + 1; col += 2) {
      sites.push_back({{row, col}, QubitRole::DATA});
    }
  }

  // X ancillas: checkerboard sublattice reaching the left and right edges.
  for (std::size_t row = 2; row < 2 * d; row += 4) {
    for (std::size_t col = 0; col < 2 * d + 2; col += 2) {
      sites.push_back({{row + 2 - (col % 4), col}, QubitRole::ANCILLA_X});
    }
  }

  // Z ancillas: complementary sublattice reaching the top and bottom edges.
  for (std::size_t row = 0; row < 2 * d + 2; row += 2) {
    for (std::size_t col = 2; col < 2 * d; col += 4) {
      sites.push_back({{row, col + (row % 4)}, QubitRole::ANCILLA_Z});
    }
  }
}

void build_stabilizers(Lattice* lattice) {
  SiteGrid grid(lattice->distance);
  for (const LatticeSite& site : lattice->sites) {
    if (site.role == QubitRole::DATA) {
      grid.mark_data(site.coord);
    }
  }

  lattice->stabilizers.reserve(lattice->num_ancillas());
  for (const LatticeSite& site : lattice->sites) {
    if (site.role == QubitRole::DATA) {
      continue;
    }
    const bool is_x = site.role == QubitRole::ANCILLA_X;
    const auto& directions = is_x ? kXScheduleDirections : kZScheduleDirections;

    StabilizerGroup group;
    group.ancilla = site.coord;
    group.type = is_x ? StabilizerType::X : StabilizerType::Z;
    for (std::size_t step = 0; step < kScheduleSteps; ++step) {
      const std::ptrdiff_t row = static_cast<std::ptrdiff_t>(site.coord.row) + directions[step].first;
      const std::ptrdiff_t col = static_cast<std::ptrdiff_t>(site.coord.col) + directions[step].second;
      if (grid.has_data(row, col)) {
        group.data_members.push_back({static_cast<std::size_t>(row), static_cast<std::size_t>(col)});
        group.member_steps.push_back(step);
      }
    }
    lattice->stabilizers.push_back(std::move(group));
  }
}

void build_logical_supports(Lattice* lattice) {
  for (const LatticeSite& site : lattice->sites) {
    if (site.role != QubitRole::DATA) {
      continue;
    }
    // Logical X runs along the first row, logical Z down the first column.
    if (site.coord.row == 1) {
      lattice->logical_x_support.push_back(site.coord);
    }
    if (site.coord.col == 1) {
      lattice->logical_z_support.push_back(site.coord);
    }
  }
}

}  // namespace

Lattice build_rotated_surface_code(std::size_t distance) {
  if (distance < 3 || distance % 2 == 0) {
    throw InvalidDistanceError(distance);
  }

  Lattice lattice;
  lattice.distance = distance;
  build_sites(&lattice);
  build_stabilizers(&lattice);
  build_logical_supports(&lattice);
  return lattice;
}

}  // namespace qsurf

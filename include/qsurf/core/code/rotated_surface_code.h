#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "qsurf/core/code/coordinate.h"

namespace qsurf {

enum class QubitRole : std::uint8_t {
  DATA = 0,
  ANCILLA_X = 1,
  ANCILLA_Z = 2,
};

enum class StabilizerType : std::uint8_t {
  X = 0,
  Z = 1,
};

// Number of CX layers in one syndrome-extraction round.
inline constexpr std::size_t kScheduleSteps = 4;

// One physical qubit site owned by a Lattice. Indices are assigned later by QubitMap.
struct LatticeSite {
  Coordinate coord;
  QubitRole role;
};

// Ancilla plus the data qubits whose X- or Z-parity it measures.
struct StabilizerGroup {
  Coordinate ancilla;
  StabilizerType type;

  // Data qubits in interaction order; member_steps[i] is the CX layer touching data_members[i].
  std::vector<Coordinate> data_members;
  std::vector<std::size_t> member_steps;

  std::size_t weight() const noexcept { return data_members.size(); }
};

// Qubit sites, stabilizer groups and logical supports of a distance-d rotated surface code.
//
// Layout:
// - data qubits at odd (row, col) in [1, 2d-1],
// - ancillas at even (row, col) in [0, 2d], X and Z types in a checkerboard,
// - weight-2 X groups on the left/right edges (col 0 and col 2d),
//   weight-2 Z groups on the top/bottom edges (row 0 and row 2d).
struct Lattice {
  std::size_t distance = 0;

  // Data sites row-major, then X ancillas, then Z ancillas (builder order).
  std::vector<LatticeSite> sites;

  // X groups followed by Z groups, one per ancilla.
  std::vector<StabilizerGroup> stabilizers;

  // Data qubits supporting the logical X operator (first row) and logical Z operator
  // (first column). Each commutes with every stabilizer and the two overlap on one qubit.
  std::vector<Coordinate> logical_x_support;
  std::vector<Coordinate> logical_z_support;

  std::size_t num_data() const noexcept { return distance * distance; }
  std::size_t num_ancillas() const noexcept { return sites.size() - num_data(); }
  std::size_t num_sites() const noexcept { return sites.size(); }
};

// Unit (row, col) offsets from an ancilla to the data qubit it touches at each schedule step.
// X groups trace an N shape and Z groups a Z shape, so hook errors run perpendicular to the
// logical operator they could shorten.
inline constexpr std::array<std::pair<int, int>, kScheduleSteps> kXScheduleDirections = {
    std::pair<int, int>{-1, 1},
    std::pair<int, int>{-1, -1},
    std::pair<int, int>{1, 1},
    std::pair<int, int>{1, -1},
};
inline constexpr std::array<std::pair<int, int>, kScheduleSteps> kZScheduleDirections = {
    std::pair<int, int>{-1, 1},
    std::pair<int, int>{1, 1},
    std::pair<int, int>{-1, -1},
    std::pair<int, int>{1, -1},
};

// Build the lattice for an odd distance >= 3. Throws InvalidDistanceError otherwise.
// Pure function of distance: identical input always yields an identical Lattice.
Lattice build_rotated_surface_code(std::size_t distance);

}  // namespace qsurf

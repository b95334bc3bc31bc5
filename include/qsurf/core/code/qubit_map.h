#pragma once

#include <cstddef>
#include <limits>
#include <optional>
#include <vector>

#include "qsurf/core/code/coordinate.h"
#include "qsurf/core/code/rotated_surface_code.h"

namespace qsurf {

using QubitIndex = std::size_t;

// Sentinel for coordinates without an assigned qubit.
inline constexpr QubitIndex kNoQubit = std::numeric_limits<QubitIndex>::max();

struct Qubit {
  QubitIndex index;
  Coordinate coord;
  QubitRole role;
};

// Stable integer labels for every lattice site.
//
// Traversal is fixed: data qubits row-major first, then ancillas in row-major lattice-scan
// order (X and Z interleaved as they appear). Re-mapping an identical Lattice reproduces
// identical indices. Both directions are plain lookup tables: index -> Qubit and a dense
// coordinate grid -> index.
class QubitMap {
 public:
  explicit QubitMap(const Lattice& lattice);

  std::size_t num_qubits() const noexcept { return qubits_.size(); }
  std::size_t num_data() const noexcept { return num_data_; }

  // All qubits ordered by index.
  const std::vector<Qubit>& qubits() const noexcept { return qubits_; }

  // Throws std::out_of_range for an unassigned index.
  const Qubit& qubit(QubitIndex index) const;

  // Throws std::out_of_range when no qubit sits at the coordinate.
  QubitIndex index_of(const Coordinate& coord) const;
  std::optional<QubitIndex> try_index_of(const Coordinate& coord) const noexcept;

  // Indices holding the given role, ascending.
  std::vector<QubitIndex> indices_with_role(QubitRole role) const;

 private:
  std::size_t num_data_ = 0;

  // Side length of the dense coordinate table.
  std::size_t dense_stride_ = 0;

  std::vector<Qubit> qubits_;

  // Dense lookup table: (row, col) -> index or kNoQubit.
  std::vector<QubitIndex> coord_to_index_dense_;

  std::size_t dense_offset(const Coordinate& coord) const noexcept {
    return coord.row * dense_stride_ + coord.col;
  }
};

}  // namespace qsurf

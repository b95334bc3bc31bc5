#include "qsurf/core/code/qubit_map.h"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

#include "qsurf/core/errors.h"

namespace qsurf {

namespace {

// Marks a grid cell as holding no lattice site.
constexpr std::size_t kEmptyCell = std::numeric_limits<std::size_t>::max();

}  // namespace

QubitMap::QubitMap(const Lattice& lattice) {
  for (const LatticeSite& site : lattice.sites) {
    dense_stride_ = std::max({dense_stride_, site.coord.row + 1, site.coord.col + 1});
  }

  // Scatter sites into a dense grid so the traversal below is a pure row-major scan.
  // A second site on an occupied cell means the lattice repeats a coordinate.
  std::vector<std::size_t> site_at(dense_stride_ * dense_stride_, kEmptyCell);
  for (std::size_t s = 0; s < lattice.sites.size(); ++s) {
    const std::size_t cell = dense_offset(lattice.sites[s].coord);
    if (site_at[cell] != kEmptyCell) {
      throw DuplicateAssignmentError(lattice.sites[s].coord);
    }
    site_at[cell] = s;
  }

  coord_to_index_dense_.assign(dense_stride_ * dense_stride_, kNoQubit);
  qubits_.reserve(lattice.sites.size());

  auto assign_pass = [&](bool want_data) {
    for (std::size_t cell = 0; cell < site_at.size(); ++cell) {
      if (site_at[cell] == kEmptyCell) {
        continue;
      }
      const LatticeSite& site = lattice.sites[site_at[cell]];
      if ((site.role == QubitRole::DATA) != want_data) {
        continue;
      }
      if (coord_to_index_dense_[cell] != kNoQubit) {
        throw DuplicateAssignmentError(site.coord);
      }
      const QubitIndex index = qubits_.size();
      coord_to_index_dense_[cell] = index;
      qubits_.push_back({index, site.coord, site.role});
    }
  };

  assign_pass(true);
  num_data_ = qubits_.size();
  assign_pass(false);
}

const Qubit& QubitMap::qubit(QubitIndex index) const {
  if (index >= qubits_.size()) {
    throw std::out_of_range("Qubit index " + std::to_string(index) + " is not assigned");
  }
  return qubits_[index];
}

std::optional<QubitIndex> QubitMap::try_index_of(const Coordinate& coord) const noexcept {
  if (coord.row >= dense_stride_ || coord.col >= dense_stride_) {
    return std::nullopt;
  }
  const QubitIndex index = coord_to_index_dense_[dense_offset(coord)];
  if (index == kNoQubit) {
    return std::nullopt;
  }
  return index;
}

QubitIndex QubitMap::index_of(const Coordinate& coord) const {
  const std::optional<QubitIndex> index = try_index_of(coord);
  if (!index.has_value()) {
    throw std::out_of_range("No qubit at coordinate " + to_string(coord));
  }
  return *index;
}

std::vector<QubitIndex> QubitMap::indices_with_role(QubitRole role) const {
  std::vector<QubitIndex> out;
  for (const Qubit& q : qubits_) {
    if (q.role == role) {
      out.push_back(q.index);
    }
  }
  return out;
}

}  // namespace qsurf

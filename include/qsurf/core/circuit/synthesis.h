#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "qsurf/core/circuit/circuit_program.h"
#include "qsurf/core/code/qubit_map.h"
#include "qsurf/core/code/rotated_surface_code.h"

namespace qsurf {

// Logical basis preserved by the memory experiment.
enum class MemoryTask : std::uint8_t {
  MEMORY_X = 0,
  MEMORY_Z = 1,
};

// Accepts memory_x / memory_z and surface_code:rotated_memory_x / surface_code:rotated_memory_z.
// Throws UnsupportedTaskError for anything else.
MemoryTask parse_memory_task(const std::string& task);
std::string_view to_string(MemoryTask task);

// Build the noiseless syndrome-extraction program for `rounds` rounds of a memory experiment.
//
// Semantics:
// - Resets data qubits in the task basis (R for MEMORY_Z, RX for MEMORY_X).
// - Each round: ROUND marker over the data qubits, ancilla resets in their own basis
//   (RX for X ancillas, R for Z ancillas), four CX layers following the lattice schedule
//   (X ancilla controls data, data controls Z ancilla), then MX / M on the ancillas.
// - Round 0 carries one-record detectors for ancillas of the task basis; later rounds compare
//   every ancilla against its previous-round record.
// - Final data readout in the task basis, one detector per task-basis stabilizer, and the
//   logical observable along the task-basis logical support.
//
// Throws std::invalid_argument for rounds == 0 and UnsupportedTaskError for an unknown task.
CircuitProgram synthesize_memory_circuit(const Lattice& lattice, const QubitMap& qubit_map,
                                         std::size_t rounds, MemoryTask task);

}  // namespace qsurf

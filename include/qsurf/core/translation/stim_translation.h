#pragma once

#include <string>

#include "qsurf/core/circuit/circuit_program.h"
#include "qsurf/core/code/qubit_map.h"

namespace stim {
struct Circuit;
}

namespace qsurf {

// Lower a CircuitProgram (noisy or noiseless) to a Stim circuit.
//
// Semantics:
// - Gates, resets, measurements and noise channels map one-to-one onto Stim instructions.
// - DETECTOR / OBSERVABLE_INCLUDE absolute record indices become rec[-k] lookbacks.
// - ROUND markers have no Stim counterpart and are dropped; TICK is kept.
// - The qubit_map overloads prefix QUBIT_COORDS(row, col) for every qubit so external
//   diagram tools can place them.
stim::Circuit build_stim_circuit_object(const CircuitProgram& program);
stim::Circuit build_stim_circuit_object(const CircuitProgram& program, const QubitMap& qubit_map);

// Stim text format of the same circuit.
std::string build_stim_circuit(const CircuitProgram& program);
std::string build_stim_circuit(const CircuitProgram& program, const QubitMap& qubit_map);

}  // namespace qsurf

#include "qsurf/core/translation/stim_translation.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "stim/circuit/circuit.h"
#include "stim/circuit/gate_target.h"

namespace qsurf {

namespace {

void append_qubit_coords(stim::Circuit* circuit, const QubitMap& qubit_map) {
  for (const Qubit& q : qubit_map.qubits()) {
    circuit->safe_append_u("QUBIT_COORDS", {static_cast<uint32_t>(q.index)},
                           {static_cast<double>(q.coord.row), static_cast<double>(q.coord.col)});
  }
}

// Converts absolute record indices to Stim lookback targets relative to `measurements_so_far`.
void append_record_lookbacks(stim::Circuit* circuit, OpCode op, const std::vector<uint32_t>& records,
                             std::size_t measurements_so_far, std::vector<uint32_t>* rec_targets) {
  rec_targets->clear();
  rec_targets->reserve(records.size());
  for (const uint32_t record : records) {
    if (record >= measurements_so_far) {
      throw std::invalid_argument(std::string(opcode_name(op)) + " references record " +
                                  std::to_string(record) + " before it is measured");
    }
    const uint32_t lookback = static_cast<uint32_t>(measurements_so_far - record);
    rec_targets->push_back(lookback | stim::TARGET_RECORD_BIT);
  }
  if (op == OpCode::OBSERVABLE_INCLUDE) {
    // Single logical observable, index 0.
    circuit->safe_append_ua("OBSERVABLE_INCLUDE", *rec_targets, 0.0);
  } else {
    circuit->safe_append_u("DETECTOR", *rec_targets);
  }
}

void append_program(stim::Circuit* circuit, const CircuitProgram& program) {
  std::size_t measurements_so_far = 0;
  std::vector<uint32_t> rec_targets;
  rec_targets.reserve(8);

  for (const Instruction& instr : program.instructions()) {
    if (instr.op == OpCode::ROUND) {
      continue;
    }
    const std::string name(opcode_name(instr.op));
    if (targets_records(instr.op)) {
      append_record_lookbacks(circuit, instr.op, instr.targets, measurements_so_far, &rec_targets);
    } else if (is_noise_op(instr.op)) {
      circuit->safe_append_ua(name, instr.targets, instr.arg);
    } else {
      circuit->safe_append_u(name, instr.targets);
    }
    if (is_measurement_op(instr.op)) {
      measurements_so_far += instr.targets.size();
    }
  }
}

}  // namespace

stim::Circuit build_stim_circuit_object(const CircuitProgram& program) {
  stim::Circuit circuit;
  append_program(&circuit, program);
  return circuit;
}

stim::Circuit build_stim_circuit_object(const CircuitProgram& program, const QubitMap& qubit_map) {
  if (qubit_map.num_qubits() != program.num_qubits()) {
    throw std::invalid_argument("Qubit map size does not match circuit qubit count");
  }
  stim::Circuit circuit;
  append_qubit_coords(&circuit, qubit_map);
  append_program(&circuit, program);
  return circuit;
}

std::string build_stim_circuit(const CircuitProgram& program) {
  return build_stim_circuit_object(program).str();
}

std::string build_stim_circuit(const CircuitProgram& program, const QubitMap& qubit_map) {
  return build_stim_circuit_object(program, qubit_map).str();
}

}  // namespace qsurf

#include "qsurf/core/circuit/circuit_program.h"

#include <ostream>
#include <stdexcept>
#include <string>

#include "qsurf/core/errors.h"

namespace qsurf {

std::string_view opcode_name(OpCode op) {
  switch (op) {
    case OpCode::R:
      return "R";
    case OpCode::RX:
      return "RX";
    case OpCode::CX:
      return "CX";
    case OpCode::M:
      return "M";
    case OpCode::MX:
      return "MX";
    case OpCode::X_ERROR:
      return "X_ERROR";
    case OpCode::Z_ERROR:
      return "Z_ERROR";
    case OpCode::DEPOLARIZE1:
      return "DEPOLARIZE1";
    case OpCode::DEPOLARIZE2:
      return "DEPOLARIZE2";
    case OpCode::DETECTOR:
      return "DETECTOR";
    case OpCode::OBSERVABLE_INCLUDE:
      return "OBSERVABLE_INCLUDE";
    case OpCode::ROUND:
      return "ROUND";
    case OpCode::TICK:
      return "TICK";
    default:
      break;
  }
  throw std::invalid_argument("Opcode " + std::to_string(static_cast<int>(op)) +
                              " is a category marker, not an operation");
}

CircuitProgram::CircuitProgram(std::size_t num_qubits) : num_qubits_(num_qubits) {}

void CircuitProgram::validate_instruction_(OpCode op, const std::vector<std::uint32_t>& targets,
                                           double arg) const {
  if (!is_gate_op(op) && !is_noise_op(op) && !is_annotation_op(op)) {
    throw std::invalid_argument("Invalid operation code " + std::to_string(static_cast<int>(op)));
  }
  if (is_noise_op(op) && !(arg >= 0.0 && arg <= 1.0)) {
    throw InvalidProbabilityError(std::string(opcode_name(op)), arg);
  } else if (!is_noise_op(op) && arg != 0.0) {
    throw std::invalid_argument("Non-probabilistic operations should not have a non-zero argument.");
  }
  if ((is_gate_op(op) || is_noise_op(op) || targets_records(op)) && targets.empty()) {
    throw std::invalid_argument(std::string(opcode_name(op)) + " requires at least one target.");
  }
  if (op == OpCode::TICK && !targets.empty()) {
    throw std::invalid_argument("TICK takes no targets.");
  }
  if (is_two_qubit_op(op)) {
    if (targets.size() % 2 != 0) {
      throw std::invalid_argument("Two-qubit operations require an even number of targets.");
    }
    for (std::size_t i = 0; i < targets.size(); i += 2) {
      if (targets[i] == targets[i + 1]) {
        throw std::invalid_argument("Two-qubit operation pairs a qubit with itself: " +
                                    std::to_string(targets[i]));
      }
    }
  }

  const std::size_t bound = targets_records(op) ? records_.size() : num_qubits_;
  for (const std::uint32_t t : targets) {
    if (t >= bound) {
      throw std::out_of_range(std::string(opcode_name(op)) + " target " + std::to_string(t) +
                              (targets_records(op) ? " exceeds measurement records ("
                                                   : " exceeds qubit count (") +
                              std::to_string(bound) + ")");
    }
  }
}

void CircuitProgram::append(OpCode op, const std::vector<std::uint32_t>& targets, double arg) {
  validate_instruction_(op, targets, arg);

  if (op == OpCode::ROUND) {
    ++num_rounds_;
  } else if (is_measurement_op(op)) {
    const std::size_t round = num_rounds_ == 0 ? 0 : num_rounds_ - 1;
    for (const std::uint32_t q : targets) {
      records_.push_back({q, round});
    }
  } else if (op == OpCode::DETECTOR) {
    detectors_.push_back(targets);
  } else if (op == OpCode::OBSERVABLE_INCLUDE) {
    observable_.insert(observable_.end(), targets.begin(), targets.end());
  }

  instructions_.push_back({op, targets, arg});
}

void CircuitProgram::safe_append(const std::string& op, const std::vector<std::uint32_t>& targets,
                                 double arg) {
  auto it = opcode_map().find(op);
  if (it == opcode_map().end()) {
    throw std::invalid_argument("Invalid operation: " + op);
  }
  append(it->second, targets, arg);
}

void CircuitProgram::print_summary(std::ostream& out) const {
  out << "Circuit Program Summary:\n";
  out << "Qubits: " << num_qubits_ << ", Rounds: " << num_rounds_
      << ", Instructions: " << instructions_.size() << ", Measurements: " << records_.size()
      << ", Detectors: " << detectors_.size() << ", Observable records: " << observable_.size()
      << "\n";

  for (std::size_t i = 0; i < instructions_.size(); ++i) {
    const Instruction& instr = instructions_[i];
    out << "  [" << i << "] " << opcode_name(instr.op);
    if (is_noise_op(instr.op)) {
      out << "(" << instr.arg << ")";
    }
    if (!instr.targets.empty()) {
      out << (targets_records(instr.op) ? " rec" : "") << " [";
      for (std::size_t j = 0; j < instr.targets.size(); ++j) {
        if (j > 0) out << ", ";
        out << instr.targets[j];
      }
      out << "]";
    }
    out << "\n";
  }
}

}  // namespace qsurf

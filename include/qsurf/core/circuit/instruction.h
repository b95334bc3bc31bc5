#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace qsurf {

enum class OpCode : std::uint8_t {
  // Clifford gates, resets and measurements
  GATE_OPS,
  R,
  RX,
  CX,
  M,
  MX,
  NOISE_OPS,  // probabilistic operations start here
  X_ERROR,
  Z_ERROR,
  DEPOLARIZE1,
  DEPOLARIZE2,

  // Annotations: no effect on qubits
  ANNOTATION_OPS,
  DETECTOR,
  OBSERVABLE_INCLUDE,
  ROUND,
  TICK,
};

inline bool is_gate_op(OpCode op) {
  return op > OpCode::GATE_OPS && op < OpCode::NOISE_OPS;
}

inline bool is_noise_op(OpCode op) {
  return op > OpCode::NOISE_OPS && op < OpCode::ANNOTATION_OPS;
}

inline bool is_annotation_op(OpCode op) {
  return op > OpCode::ANNOTATION_OPS;
}

inline bool is_reset_op(OpCode op) {
  return op == OpCode::R || op == OpCode::RX;
}

inline bool is_measurement_op(OpCode op) {
  return op == OpCode::M || op == OpCode::MX;
}

inline bool is_entangling_op(OpCode op) {
  return op == OpCode::CX;
}

inline bool is_two_qubit_op(OpCode op) {
  return op == OpCode::CX || op == OpCode::DEPOLARIZE2;
}

// Targets of these ops are measurement-record indices rather than qubits.
inline bool targets_records(OpCode op) {
  return op == OpCode::DETECTOR || op == OpCode::OBSERVABLE_INCLUDE;
}

inline const std::unordered_map<std::string, OpCode>& opcode_map() {
  static const std::unordered_map<std::string, OpCode> kMap = {
      {"R",                  OpCode::R},
      {"RX",                 OpCode::RX},
      {"CX",                 OpCode::CX},
      {"M",                  OpCode::M},
      {"MX",                 OpCode::MX},
      {"X_ERROR",            OpCode::X_ERROR},
      {"Z_ERROR",            OpCode::Z_ERROR},
      {"DEPOLARIZE1",        OpCode::DEPOLARIZE1},
      {"DEPOLARIZE2",        OpCode::DEPOLARIZE2},
      {"DETECTOR",           OpCode::DETECTOR},
      {"OBSERVABLE_INCLUDE", OpCode::OBSERVABLE_INCLUDE},
      {"ROUND",              OpCode::ROUND},
      {"TICK",               OpCode::TICK},
  };
  return kMap;
}

std::string_view opcode_name(OpCode op);

struct Instruction {
  OpCode op;

  // Qubit indices, or measurement-record indices for DETECTOR / OBSERVABLE_INCLUDE.
  std::vector<std::uint32_t> targets;

  double arg = 0.0;  // probability if needed
};

}  // namespace qsurf

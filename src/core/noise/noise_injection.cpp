#include "qsurf/core/noise/noise_injection.h"

#include <cstdint>
#include <utility>
#include <vector>

namespace qsurf {

namespace {

// Pauli that flips an outcome in the op's basis.
OpCode flip_error_for(OpCode op) {
  return (op == OpCode::RX || op == OpCode::MX) ? OpCode::Z_ERROR : OpCode::X_ERROR;
}

void append_noise(CircuitProgram* program, OpCode op, const std::vector<std::uint32_t>& targets,
                  double p) {
  if (p > 0.0 && !targets.empty()) {
    program->append(op, targets, p);
  }
}

}  // namespace

NoisyCircuitProgram inject_noise(const CircuitProgram& program, const NoiseModel& noise) {
  const double p_clifford = noise.get(NoiseChannel::kAfterCliffordDepolarization);
  const double p_data = noise.get(NoiseChannel::kBeforeRoundDataDepolarization);
  const double p_measure = noise.get(NoiseChannel::kBeforeMeasureFlipProbability);
  const double p_reset = noise.get(NoiseChannel::kAfterResetFlipProbability);

  CircuitProgram noisy(program.num_qubits());
  for (const Instruction& instr : program.instructions()) {
    if (is_measurement_op(instr.op)) {
      append_noise(&noisy, flip_error_for(instr.op), instr.targets, p_measure);
    }

    noisy.append(instr.op, instr.targets, instr.arg);

    if (is_entangling_op(instr.op)) {
      append_noise(&noisy, OpCode::DEPOLARIZE2, instr.targets, p_clifford);
    } else if (is_reset_op(instr.op)) {
      append_noise(&noisy, flip_error_for(instr.op), instr.targets, p_reset);
    } else if (instr.op == OpCode::ROUND) {
      append_noise(&noisy, OpCode::DEPOLARIZE1, instr.targets, p_data);
    }
  }

  return NoisyCircuitProgram{program, std::move(noisy), noise};
}

}  // namespace qsurf

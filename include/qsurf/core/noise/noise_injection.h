#pragma once

#include "qsurf/core/circuit/circuit_program.h"
#include "qsurf/core/noise/noise_model.h"

namespace qsurf {

// Output of the noise injector. `noiseless` is an unmodified copy of the input program;
// `noisy` has the same measurement records, detectors and observable plus noise instructions.
struct NoisyCircuitProgram {
  CircuitProgram noiseless;
  CircuitProgram noisy;
  NoiseModel noise;
};

// Insert the model's error channels as extra instructions:
// - DEPOLARIZE2 (after_clifford_depolarization) after every CX,
// - DEPOLARIZE1 (before_round_data_depolarization) on the data qubits of every ROUND marker,
// - X_ERROR before M and Z_ERROR before MX (before_measure_flip_probability),
// - X_ERROR after R and Z_ERROR after RX (after_reset_flip_probability).
// Channels with probability 0 insert nothing. The input program is never modified.
NoisyCircuitProgram inject_noise(const CircuitProgram& program, const NoiseModel& noise);

}  // namespace qsurf

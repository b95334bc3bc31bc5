#include "qsurf/core/experiment/memory_experiment.h"

#include <iostream>

int main() {
  qsurf::NoiseModel noise = qsurf::NoiseModel()
                                .with_probability("after_clifford_depolarization", 0.001)
                                .with_probability("before_measure_flip_probability", 0.002);

  const qsurf::MemoryExperimentParams params(qsurf::MemoryTask::MEMORY_Z, 5, 5, noise, 1000,
                                             12345ULL);
  const qsurf::MemoryExperimentResult result = qsurf::run_memory_experiment(params);

  std::cout << "Qubits: " << result.qubit_map.num_qubits()
            << ", records per shot: " << result.samples.num_records() << "\n";
  qsurf::print_sample_summary(result.summary, std::cout);
  return 0;
}

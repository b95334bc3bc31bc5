#include "qsurf/core/experiment/memory_experiment.h"

#include <stdexcept>
#include <utility>

#include "qsurf/core/errors.h"

namespace qsurf {

namespace {

void validate_params(const MemoryExperimentParams& params) {
  if (params.distance < 3 || params.distance % 2 == 0) {
    throw InvalidDistanceError(params.distance);
  }
  if (params.rounds == 0) {
    throw std::invalid_argument("Number of QEC rounds must be greater than 0");
  }
  if (params.shots == 0) {
    throw SamplingError(static_cast<long long>(params.shots));
  }
}

}  // namespace

MemoryExperimentResult run_memory_experiment(const MemoryExperimentParams& params) {
  validate_params(params);

  Lattice lattice = build_rotated_surface_code(params.distance);
  QubitMap qubit_map(lattice);
  const CircuitProgram program =
      synthesize_memory_circuit(lattice, qubit_map, params.rounds, params.task);
  NoisyCircuitProgram circuits = inject_noise(program, params.noise);

  const Sampler sampler(
      SamplerParams(params.shots, params.seed, params.skip_ref_sample, params.num_threads));
  SampleResult samples = sampler.sample(circuits);
  SampleSummary summary = summarize(circuits, samples);

  return MemoryExperimentResult{std::move(lattice), std::move(qubit_map), std::move(circuits),
                                std::move(samples), summary};
}

}  // namespace qsurf

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "qsurf/core/circuit/circuit_program.h"
#include "qsurf/core/circuit/synthesis.h"
#include "qsurf/core/code/qubit_map.h"
#include "qsurf/core/code/rotated_surface_code.h"
#include "qsurf/core/noise/noise_injection.h"
#include "qsurf/core/noise/noise_model.h"
#include "qsurf/core/sim/analysis.h"
#include "qsurf/core/sim/sampler.h"

namespace qsurf {

// Immutable configuration for one end-to-end memory experiment.
struct MemoryExperimentParams {
  MemoryTask task;
  std::size_t distance;
  std::size_t rounds;
  NoiseModel noise;
  std::size_t shots;
  std::optional<std::uint64_t> seed;
  bool skip_ref_sample;
  std::size_t num_threads;

  MemoryExperimentParams(MemoryTask task_, std::size_t distance_, std::size_t rounds_,
                         NoiseModel noise_, std::size_t shots_,
                         std::optional<std::uint64_t> seed_ = std::nullopt,
                         bool skip_ref_sample_ = false, std::size_t num_threads_ = 1)
      : task(task_),
        distance(distance_),
        rounds(rounds_),
        noise(noise_),
        shots(shots_),
        seed(seed_),
        skip_ref_sample(skip_ref_sample_),
        num_threads(num_threads_) {}

  // Convenience for callers holding a task string; throws UnsupportedTaskError.
  MemoryExperimentParams(const std::string& task_, std::size_t distance_, std::size_t rounds_,
                         NoiseModel noise_, std::size_t shots_,
                         std::optional<std::uint64_t> seed_ = std::nullopt,
                         bool skip_ref_sample_ = false, std::size_t num_threads_ = 1)
      : MemoryExperimentParams(parse_memory_task(task_), distance_, rounds_, noise_, shots_, seed_,
                               skip_ref_sample_, num_threads_) {}
};

// Every intermediate artifact of the pipeline, kept for inspection and export.
struct MemoryExperimentResult {
  Lattice lattice;
  QubitMap qubit_map;
  NoisyCircuitProgram circuits;
  SampleResult samples;
  SampleSummary summary;
};

// Lattice -> qubit map -> synthesis -> noise injection -> sampling.
// Validates distance, rounds and shots before any work, in that order.
MemoryExperimentResult run_memory_experiment(const MemoryExperimentParams& params);

}  // namespace qsurf

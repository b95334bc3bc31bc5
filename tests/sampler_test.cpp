#include "qsurf/core/circuit/synthesis.h"
#include "qsurf/core/code/qubit_map.h"
#include "qsurf/core/code/rotated_surface_code.h"
#include "qsurf/core/errors.h"
#include "qsurf/core/noise/noise_injection.h"
#include "qsurf/core/sim/analysis.h"
#include "qsurf/core/sim/sampler.h"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace qsurf;

NoisyCircuitProgram make_program(std::size_t d, std::size_t rounds, MemoryTask task,
                                 const NoiseModel& noise) {
  const Lattice lattice = build_rotated_surface_code(d);
  const QubitMap qubit_map(lattice);
  return inject_noise(synthesize_memory_circuit(lattice, qubit_map, rounds, task), noise);
}

void expect_all_zero(const BitMatrix& matrix, const char* what) {
  for (const std::vector<std::uint8_t>& row : matrix) {
    for (const std::uint8_t bit : row) {
      if (bit != 0) {
        throw std::runtime_error(what);
      }
    }
  }
}

}  // namespace

int main() {
  using namespace qsurf;

  // Noiseless d=3, two rounds, five shots: no detector fires and the observable never flips.
  for (const MemoryTask task : {MemoryTask::MEMORY_Z, MemoryTask::MEMORY_X}) {
    const NoisyCircuitProgram program = make_program(3, 2, task, NoiseModel());
    const Sampler sampler(SamplerParams(5, 7ULL));
    const SampleResult result = sampler.sample(program);

    if (result.num_shots() != 5 || result.num_records() != 25) {
      throw std::runtime_error("Expected a 5 x 25 measurement matrix");
    }
    if (result.seed != 7 || result.seed_from_entropy) {
      throw std::runtime_error("Explicit seed must be reported unchanged");
    }
    if (!result.reference.has_value() || result.reference->size() != 5 ||
        result.reference->front().size() != 25) {
      throw std::runtime_error("Reference must match the measurement shape");
    }
    expect_all_zero(detector_parities(program.noiseless, result.measurements),
                    "Noiseless detectors must never fire");
    const std::vector<std::uint8_t> observables =
        observable_values(program.noiseless, result.measurements);
    for (const std::uint8_t value : observables) {
      if (value != observables.front()) {
        throw std::runtime_error("Noiseless observable must agree across shots");
      }
    }
    // Individual records may be random; only the observable is pinned to the reference.
    const BitMatrix flips = flip_events(result.measurements, *result.reference);
    if (flips.size() != 5 || observable_values(program.noiseless, flips).front() != 0) {
      throw std::runtime_error("Noiseless observable must match the reference observable");
    }

    // Skipping the reference keeps every detector deterministic.
    const Sampler skip(SamplerParams(5, 7ULL, true));
    const SampleResult skipped = skip.sample(program);
    if (skipped.reference.has_value()) {
      throw std::runtime_error("Skipped reference must be absent");
    }
    expect_all_zero(detector_parities(program.noiseless, skipped.measurements),
                    "Detectors must stay silent without a reference sample");
  }

  const NoisyCircuitProgram noisy =
      make_program(3, 3, MemoryTask::MEMORY_Z, NoiseModel(0.02, 0.02, 0.02, 0.02));

  // Same seed, same bits; any thread count.
  const SampleResult a = Sampler(SamplerParams(200, 42ULL)).sample(noisy);
  const SampleResult b = Sampler(SamplerParams(200, 42ULL)).sample(noisy);
  const SampleResult threaded = Sampler(SamplerParams(200, 42ULL, false, 3)).sample(noisy);
  if (a.measurements != b.measurements) {
    throw std::runtime_error("Sampling must be reproducible for a fixed seed");
  }
  if (a.measurements != threaded.measurements) {
    throw std::runtime_error("Sampling must not depend on the thread count");
  }
  const SampleResult other = Sampler(SamplerParams(200, 43ULL)).sample(noisy);
  if (a.measurements == other.measurements) {
    throw std::runtime_error("Different seeds should produce different samples");
  }
  if (derive_block_seed(42, 0) == derive_block_seed(42, 1) ||
      derive_block_seed(42, 0) == derive_block_seed(43, 0)) {
    throw std::runtime_error("Per-block seeds must differ by block and by seed");
  }

  // Several frame batches: a partial last block, blocks split unevenly across workers, and a
  // shot count that is not a multiple of the block size.
  const std::size_t many = 2 * kShotsPerBlock + 89;
  const SampleResult serial = Sampler(SamplerParams(many, 42ULL)).sample(noisy);
  if (serial.num_shots() != many || serial.num_records() != noisy.noisy.num_measurements()) {
    throw std::runtime_error("Multi-block run must fill every shot row");
  }
  for (const std::size_t threads : {2u, 3u, 8u}) {
    const SampleResult parallel =
        Sampler(SamplerParams(many, 42ULL, false, threads)).sample(noisy);
    if (parallel.measurements != serial.measurements) {
      throw std::runtime_error("Multi-block sampling must not depend on the thread count");
    }
  }
  // A shot's bits depend only on (seed, shot index), not on how many shots were requested.
  for (std::size_t shot = 0; shot < a.num_shots(); ++shot) {
    if (serial.measurements[shot] != a.measurements[shot]) {
      throw std::runtime_error("Leading shots must match a shorter run with the same seed");
    }
  }
  // Lanes within one batch draw independent noise.
  bool lanes_differ = false;
  for (std::size_t shot = 1; shot < kShotsPerBlock && !lanes_differ; ++shot) {
    lanes_differ = serial.measurements[shot] != serial.measurements[0];
  }
  if (!lanes_differ) {
    throw std::runtime_error("Shots within a block must not repeat one another");
  }

  // Entropy seed is drawn once per sampler and reported.
  const Sampler entropy(SamplerParams(2));
  const SampleResult drawn = entropy.sample(noisy);
  if (!drawn.seed_from_entropy || drawn.seed != entropy.seed()) {
    throw std::runtime_error("Entropy seed must be reported");
  }

  // More noise, more detection events.
  const NoisyCircuitProgram low =
      make_program(3, 3, MemoryTask::MEMORY_Z, NoiseModel(0.001, 0.001, 0.001, 0.001));
  const NoisyCircuitProgram high =
      make_program(3, 3, MemoryTask::MEMORY_Z, NoiseModel(0.05, 0.05, 0.05, 0.05));
  const SampleSummary low_summary = summarize(low, Sampler(SamplerParams(2000, 5ULL)).sample(low));
  const SampleSummary high_summary =
      summarize(high, Sampler(SamplerParams(2000, 5ULL)).sample(high));
  if (!(low_summary.detector_event_fraction < high_summary.detector_event_fraction)) {
    throw std::runtime_error("Detection event rate must grow with the error rate");
  }
  if (high_summary.error_rates[0] != 0.05 || !high_summary.has_reference) {
    throw std::runtime_error("Summary must carry the resolved error rates");
  }

  bool threw = false;
  try {
    const Sampler bad(SamplerParams(0, 1ULL));
    (void)bad;
  } catch (const SamplingError& e) {
    threw = e.shots() == 0;
  }
  if (!threw) {
    throw std::runtime_error("Expected SamplingError for zero shots");
  }

  return 0;
}

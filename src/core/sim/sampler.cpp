#include "qsurf/core/sim/sampler.h"

#include <algorithm>
#include <exception>
#include <random>
#include <thread>
#include <utility>

#include "internal/fast_rng.h"
#include "qsurf/core/errors.h"
#include "qsurf/core/translation/stim_translation.h"
#include "stim/circuit/circuit.h"
#include "stim/simulators/frame_simulator.h"
#include "stim/simulators/tableau_simulator.h"

namespace qsurf {

namespace {

constexpr std::size_t kBitWidth = stim::MAX_BITWORD_WIDTH;
using frame_sim_type = stim::FrameSimulator<kBitWidth>;

std::uint64_t draw_entropy_seed() {
  std::random_device device;
  return (static_cast<std::uint64_t>(device()) << 32) ^ static_cast<std::uint64_t>(device());
}

// Samples blocks [first_block, last_block) into their rows of `out`. One frame simulator of
// kShotsPerBlock lanes is reused and reseeded per block; lanes past the shot count are dropped.
void sample_block_range(const stim::Circuit& circuit, const std::vector<std::uint8_t>& reference,
                        std::uint64_t seed, std::size_t first_block, std::size_t last_block,
                        BitMatrix* out) {
  frame_sim_type sim(circuit.compute_stats(), stim::FrameSimulatorMode::STORE_MEASUREMENTS_TO_MEMORY,
                     kShotsPerBlock, std::mt19937_64(seed));
  const std::size_t num_records = reference.size();
  const std::size_t num_shots = out->size();

  for (std::size_t block = first_block; block < last_block; ++block) {
    sim.rng.seed(derive_block_seed(seed, block));
    sim.reset_all();
    sim.do_circuit(circuit);

    const std::size_t begin = block * kShotsPerBlock;
    const std::size_t end = std::min(num_shots, begin + kShotsPerBlock);
    for (std::size_t shot = begin; shot < end; ++shot) {
      // Frame simulation yields flips relative to the reference sample.
      std::vector<std::uint8_t>& row = (*out)[shot];
      row.resize(num_records);
      for (std::size_t m = 0; m < num_records; ++m) {
        const bool flipped = sim.m_record.storage[m][shot - begin];
        row[m] = static_cast<std::uint8_t>(flipped ^ (reference[m] != 0));
      }
    }
  }
}

}  // namespace

std::uint64_t derive_block_seed(std::uint64_t seed, std::size_t block) {
  return internal::stream_seed(seed, block);
}

Sampler::Sampler(SamplerParams params)
    : params_(std::move(params)),
      seed_(params_.seed.has_value() ? *params_.seed : draw_entropy_seed()),
      seed_from_entropy_(!params_.seed.has_value()) {
  validate_params();
}

void Sampler::validate_params() const {
  if (params_.shots == 0) {
    throw SamplingError(static_cast<long long>(params_.shots));
  }
  if (params_.num_threads == 0) {
    throw std::invalid_argument("Number of sampler threads must be greater than 0");
  }
}

SampleResult Sampler::sample(const NoisyCircuitProgram& program) const {
  if (program.noisy.num_measurements() != program.noiseless.num_measurements()) {
    throw std::invalid_argument("Noisy and noiseless programs disagree on measurement count");
  }

  const stim::Circuit noisy_circuit = build_stim_circuit_object(program.noisy);
  const std::size_t num_records = program.noisy.num_measurements();

  SampleResult result;
  result.seed = seed_;
  result.seed_from_entropy = seed_from_entropy_;

  std::vector<std::uint8_t> reference(num_records, 0);
  if (!params_.skip_ref_sample) {
    // One noiseless execution; random outcomes resolve to 0.
    const stim::Circuit noiseless_circuit = build_stim_circuit_object(program.noiseless);
    const stim::simd_bits<kBitWidth> ref_bits =
        stim::TableauSimulator<kBitWidth>::reference_sample_circuit(noiseless_circuit);
    for (std::size_t m = 0; m < num_records; ++m) {
      reference[m] = ref_bits[m] ? 1 : 0;
    }
    result.reference = BitMatrix(params_.shots, reference);
  }

  result.measurements.resize(params_.shots);
  const std::size_t num_blocks = (params_.shots + kShotsPerBlock - 1) / kShotsPerBlock;
  const std::size_t workers = std::min(params_.num_threads, num_blocks);
  if (workers == 1) {
    sample_block_range(noisy_circuit, reference, seed_, 0, num_blocks, &result.measurements);
    return result;
  }

  // Contiguous block ranges; each worker owns its rows, so no synchronization is needed.
  std::vector<std::thread> threads;
  std::vector<std::exception_ptr> failures(workers);
  threads.reserve(workers);
  const std::size_t per_worker = (num_blocks + workers - 1) / workers;
  try {
    for (std::size_t w = 0; w < workers; ++w) {
      const std::size_t first = std::min(num_blocks, w * per_worker);
      const std::size_t last = std::min(num_blocks, first + per_worker);
      threads.emplace_back([&, w, first, last]() {
        try {
          sample_block_range(noisy_circuit, reference, seed_, first, last, &result.measurements);
        } catch (...) {
          failures[w] = std::current_exception();
        }
      });
    }
  } catch (...) {
    // A failed spawn must not destroy joinable threads.
    for (std::thread& t : threads) {
      t.join();
    }
    throw;
  }
  for (std::thread& t : threads) {
    t.join();
  }
  for (const std::exception_ptr& failure : failures) {
    if (failure) {
      std::rethrow_exception(failure);
    }
  }
  return result;
}

}  // namespace qsurf

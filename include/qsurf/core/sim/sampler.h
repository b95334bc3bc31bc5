#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "qsurf/core/noise/noise_injection.h"

namespace qsurf {

// Row-major bit matrix, one row per shot.
using BitMatrix = std::vector<std::vector<std::uint8_t>>;

// Immutable configuration object for one sampler run.
struct SamplerParams {
  // Number of independent repetitions; must be >= 1.
  std::size_t shots;

  // Explicit seed for reproducible output. Unset means "draw from std::random_device";
  // the seed actually used is reported in SampleResult.
  std::optional<std::uint64_t> seed;

  // Skip the noiseless reference run. Shots are then sampled against an all-zero reference,
  // which is exact for synthesized memory circuits (every deterministic outcome is 0).
  bool skip_ref_sample;

  // Worker threads over disjoint block ranges. Output does not depend on this value.
  std::size_t num_threads;

  SamplerParams(std::size_t shots_, std::optional<std::uint64_t> seed_ = std::nullopt,
                bool skip_ref_sample_ = false, std::size_t num_threads_ = 1)
      : shots(shots_), seed(seed_), skip_ref_sample(skip_ref_sample_), num_threads(num_threads_) {}
};

// Sampler output. Created fresh per sample() call.
struct SampleResult {
  // shots x num_measurement_records.
  BitMatrix measurements;

  // Noiseless outcomes with the same shape, absent when the reference run was skipped.
  std::optional<BitMatrix> reference;

  // Seed used for this run, and whether it came from the entropy source.
  std::uint64_t seed = 0;
  bool seed_from_entropy = false;

  std::size_t num_shots() const noexcept { return measurements.size(); }
  std::size_t num_records() const noexcept {
    return measurements.empty() ? 0 : measurements.front().size();
  }
};

// Shots are simulated in fixed blocks of this many, one Stim frame batch per block.
constexpr std::size_t kShotsPerBlock = 256;

// Position-independent per-block seed: splitmix64 over (seed, block).
std::uint64_t derive_block_seed(std::uint64_t seed, std::size_t block);

// Monte Carlo sampler for noisy circuit programs, backed by Stim's Pauli-frame simulator.
//
// Shot i belongs to block i / kShotsPerBlock. Every block is a full-width frame batch seeded by
// derive_block_seed(seed, block), so shot i has the same bits for any shot count and any
// num_threads value.
class Sampler {
 public:
  // Throws SamplingError when shots == 0.
  explicit Sampler(SamplerParams params);

  SampleResult sample(const NoisyCircuitProgram& program) const;

  // Resolved seed (explicit or drawn at construction).
  std::uint64_t seed() const noexcept { return seed_; }

 private:
  // Immutable run-time input copied at construction.
  SamplerParams params_;

  std::uint64_t seed_;
  bool seed_from_entropy_;

  void validate_params() const;
};

}  // namespace qsurf

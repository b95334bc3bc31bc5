#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "qsurf/core/circuit/circuit_program.h"
#include "qsurf/core/code/qubit_map.h"
#include "qsurf/core/noise/noise_injection.h"
#include "qsurf/core/sim/sampler.h"

namespace qsurf {

// Human-readable identity of one measurement record.
struct MeasurementLabel {
  std::size_t record;
  QubitIndex qubit;
  Coordinate coord;
  QubitRole role;
  std::size_t round;
  // True for the terminal data-qubit readout.
  bool final_readout;
};

std::vector<MeasurementLabel> label_measurements(const CircuitProgram& program,
                                                 const QubitMap& qubit_map);

// shots x num_detectors. Each entry is the XOR of the detector's records in that shot.
BitMatrix detector_parities(const CircuitProgram& program, const BitMatrix& measurements);

// One logical-observable parity per shot.
std::vector<std::uint8_t> observable_values(const CircuitProgram& program,
                                            const BitMatrix& measurements);

// Element-wise XOR of sampled and reference records. Throws std::invalid_argument on a shape
// mismatch.
BitMatrix flip_events(const BitMatrix& measurements, const BitMatrix& reference);

// Aggregate view of one sampling run.
struct SampleSummary {
  std::size_t shots = 0;
  std::size_t records = 0;
  std::size_t detectors = 0;
  std::uint64_t seed = 0;
  bool seed_from_entropy = false;

  // Fraction of (shot, detector) pairs that fired.
  double detector_event_fraction = 0.0;

  // Fraction of shots whose observable differs from the reference observable.
  double observable_flip_fraction = 0.0;

  // Fraction of (shot, record) pairs that differ from the reference. Zero when no reference
  // was taken.
  double reference_mismatch_fraction = 0.0;
  bool has_reference = false;

  // Error rates the noisy program was built with, indexed by NoiseChannel.
  NoiseModel::Values error_rates{};
};

SampleSummary summarize(const NoisyCircuitProgram& program, const SampleResult& result);

void print_sample_summary(const SampleSummary& summary, std::ostream& out);

}  // namespace qsurf

#include "qsurf/core/circuit/synthesis.h"
#include "qsurf/core/code/qubit_map.h"
#include "qsurf/core/code/rotated_surface_code.h"
#include "qsurf/core/noise/noise_injection.h"
#include "qsurf/core/sim/analysis.h"
#include "qsurf/core/sim/sampler.h"

#include <cmath>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using namespace qsurf;

constexpr std::size_t kShots = 3000;
constexpr std::uint64_t kSeed = 2024;
constexpr double kLow = 0.002;
constexpr double kHigh = 0.04;

double max_double(double a, double b) { return a > b ? a : b; }

double event_fraction(const CircuitProgram& program, const NoiseModel& noise) {
  const NoisyCircuitProgram noisy = inject_noise(program, noise);
  return summarize(noisy, Sampler(SamplerParams(kShots, kSeed)).sample(noisy))
      .detector_event_fraction;
}

// Raising `channel` from kLow to kHigh on top of `base` must raise the detection event rate.
void check_channel(const CircuitProgram& program, const NoiseModel& base, NoiseChannel channel,
                   const std::string& label) {
  const double low = event_fraction(program, base.with_probability(channel, kLow));
  const double high = event_fraction(program, base.with_probability(channel, kHigh));

  const std::size_t trials = kShots * program.num_detectors();
  const double sigma = std::sqrt(high * (1.0 - high) / static_cast<double>(trials));
  const double tolerance = max_double(5.0 * sigma, 0.001);

  std::cout << label << " " << NoiseModel::to_string(channel) << ": low=" << low
            << " high=" << high << "\n";
  if (high < low - tolerance) {
    throw std::runtime_error(label + ": raising " + std::string(NoiseModel::to_string(channel)) +
                             " lowered the detection event rate");
  }
  // Every channel is visible to the detectors on its own; an inert channel would leave the
  // rate unchanged.
  if (!(high > low + tolerance)) {
    throw std::runtime_error(label + ": " + std::string(NoiseModel::to_string(channel)) +
                             " does not reach the detectors");
  }
}

}  // namespace

int main() {
  const Lattice lattice = build_rotated_surface_code(3);
  const QubitMap qubit_map(lattice);
  const NoiseModel background(0.005, 0.005, 0.005, 0.005);

  for (const MemoryTask task : {MemoryTask::MEMORY_Z, MemoryTask::MEMORY_X}) {
    const CircuitProgram program = synthesize_memory_circuit(lattice, qubit_map, 3, task);
    const std::string name(to_string(task));

    for (std::size_t c = 0; c < static_cast<std::size_t>(NoiseChannel::kCount); ++c) {
      const NoiseChannel channel = static_cast<NoiseChannel>(c);
      // Other channels silent, then other channels held at a fixed background rate.
      check_channel(program, NoiseModel(), channel, name + " isolated");
      check_channel(program, background, channel, name + " background");
    }
  }

  std::cout << "noise_monotonicity_test passed\n";
  return 0;
}

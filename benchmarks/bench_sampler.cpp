#include "qsurf/core/circuit/synthesis.h"
#include "qsurf/core/code/qubit_map.h"
#include "qsurf/core/code/rotated_surface_code.h"
#include "qsurf/core/noise/noise_injection.h"
#include "qsurf/core/sim/sampler.h"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

std::size_t parse_or_default(char* arg, std::size_t fallback) {
  if (arg == nullptr) {
    return fallback;
  }
  return static_cast<std::size_t>(std::stoull(arg));
}

}  // namespace

int main(int argc, char* argv[]) {
  const std::size_t shots = parse_or_default(argc > 1 ? argv[1] : nullptr, 10000);
  const std::size_t distance = parse_or_default(argc > 2 ? argv[2] : nullptr, 7);
  const std::size_t rounds = parse_or_default(argc > 3 ? argv[3] : nullptr, 7);
  const std::size_t threads = parse_or_default(argc > 4 ? argv[4] : nullptr, 1);

  const auto synth_start = std::chrono::steady_clock::now();
  const qsurf::Lattice lattice = qsurf::build_rotated_surface_code(distance);
  const qsurf::QubitMap qubit_map(lattice);
  const qsurf::CircuitProgram program =
      qsurf::synthesize_memory_circuit(lattice, qubit_map, rounds, qsurf::MemoryTask::MEMORY_Z);
  const qsurf::NoisyCircuitProgram circuits =
      qsurf::inject_noise(program, qsurf::NoiseModel(1e-3, 1e-3, 1e-3, 1e-3));
  const auto synth_end = std::chrono::steady_clock::now();

  const qsurf::Sampler sampler(qsurf::SamplerParams(shots, 12345ULL, false, threads));
  const auto start = std::chrono::steady_clock::now();
  const qsurf::SampleResult result = sampler.sample(circuits);
  const auto end = std::chrono::steady_clock::now();

  const std::chrono::duration<double> synth_elapsed = synth_end - synth_start;
  const std::chrono::duration<double> elapsed = end - start;
  std::cout << "SynthesisSeconds: " << synth_elapsed.count() << "\n";
  std::cout << "ElapsedSeconds: " << elapsed.count() << "\n";
  std::cout << "Shots/sec: " << (static_cast<double>(shots) / elapsed.count()) << "\n";
  std::cout << "Records: " << result.num_records() << "\n";
  return 0;
}

#include "qsurf/core/circuit/synthesis.h"
#include "qsurf/core/code/qubit_map.h"
#include "qsurf/core/code/rotated_surface_code.h"
#include "qsurf/core/noise/noise_injection.h"
#include "qsurf/core/translation/stim_translation.h"
#include "stim/circuit/circuit.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::vector<std::string> split_lines(const std::string& text) {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string::npos) {
      end = text.size();
    }
    if (end > start) {
      lines.push_back(text.substr(start, end - start));
    }
    start = end + 1;
  }
  return lines;
}

bool starts_with(const std::string& s, const char* prefix) {
  return s.rfind(prefix, 0) == 0;
}

std::size_t count_prefix(const std::vector<std::string>& lines, const char* prefix) {
  std::size_t count = 0;
  for (const std::string& line : lines) {
    if (starts_with(line, prefix)) {
      ++count;
    }
  }
  return count;
}

std::size_t first_index_of_prefix(const std::vector<std::string>& lines, const char* prefix) {
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (starts_with(lines[i], prefix)) {
      return i;
    }
  }
  return static_cast<std::size_t>(-1);
}

}  // namespace

int main() {
  using namespace qsurf;

  const Lattice lattice = build_rotated_surface_code(3);
  const QubitMap qubit_map(lattice);
  const std::size_t rounds = 2;
  const CircuitProgram program =
      synthesize_memory_circuit(lattice, qubit_map, rounds, MemoryTask::MEMORY_Z);

  const std::string circuit = build_stim_circuit(program, qubit_map);
  if (circuit.empty()) {
    throw std::runtime_error("Stim translation produced an empty circuit");
  }
  const std::vector<std::string> lines = split_lines(circuit);

  if (count_prefix(lines, "QUBIT_COORDS") != qubit_map.num_qubits()) {
    throw std::runtime_error("Expected one QUBIT_COORDS per qubit");
  }
  if (lines.front() != "QUBIT_COORDS(1, 1) 0") {
    throw std::runtime_error("First qubit must be the top-left data qubit, got: " + lines.front());
  }
  // TICKs separate CX layers, so Stim cannot fuse them.
  if (count_prefix(lines, "CX ") != kScheduleSteps * rounds) {
    throw std::runtime_error("Unexpected number of CX layers in translated circuit");
  }
  if (count_prefix(lines, "TICK") != 1 + 5 * rounds) {
    throw std::runtime_error("Unexpected number of TICKs");
  }
  if (count_prefix(lines, "RX ") != rounds || count_prefix(lines, "R ") != rounds + 1) {
    throw std::runtime_error("Unexpected reset instructions");
  }
  if (count_prefix(lines, "MX ") != rounds || count_prefix(lines, "M ") != rounds + 1) {
    throw std::runtime_error("Unexpected measurement instructions");
  }
  if (count_prefix(lines, "DETECTOR") != program.num_detectors()) {
    throw std::runtime_error("Unexpected number of DETECTOR instructions");
  }
  if (count_prefix(lines, "OBSERVABLE_INCLUDE(0)") != 1) {
    throw std::runtime_error("Expected one logical observable include");
  }
  if (circuit.find("ROUND") != std::string::npos) {
    throw std::runtime_error("ROUND markers have no Stim counterpart");
  }

  // Round 0 detectors look at Z-ancilla records, which follow the four X-ancilla records.
  const std::size_t first_detector = first_index_of_prefix(lines, "DETECTOR");
  if (lines[first_detector] != "DETECTOR rec[-4]") {
    throw std::runtime_error("Unexpected first detector: " + lines[first_detector]);
  }

  const stim::Circuit object = build_stim_circuit_object(program);
  if (object.count_measurements() != program.num_measurements() ||
      object.count_detectors() != program.num_detectors() ||
      object.count_observables() != 1) {
    throw std::runtime_error("Stim circuit statistics disagree with the program");
  }

  // Noise channels survive translation with their probabilities.
  const NoisyCircuitProgram noisy = inject_noise(program, NoiseModel(0.01, 0.02, 0.03, 0.04));
  const std::vector<std::string> noisy_lines = split_lines(build_stim_circuit(noisy.noisy));
  if (count_prefix(noisy_lines, "DEPOLARIZE2(0.01)") != kScheduleSteps * rounds) {
    throw std::runtime_error("Expected DEPOLARIZE2 after every CX layer");
  }
  if (count_prefix(noisy_lines, "DEPOLARIZE1(0.02)") != rounds) {
    throw std::runtime_error("Expected one DEPOLARIZE1 per round");
  }
  const std::size_t first_cx = first_index_of_prefix(noisy_lines, "CX ");
  if (first_cx == static_cast<std::size_t>(-1) ||
      !starts_with(noisy_lines[first_cx + 1], "DEPOLARIZE2(0.01)")) {
    throw std::runtime_error("DEPOLARIZE2 must directly follow its CX layer");
  }
  if (count_prefix(noisy_lines, "X_ERROR(0.03)") != rounds + 1 ||
      count_prefix(noisy_lines, "Z_ERROR(0.03)") != rounds) {
    throw std::runtime_error("Unexpected measurement flip channels");
  }
  if (count_prefix(noisy_lines, "X_ERROR(0.04)") != rounds + 1 ||
      count_prefix(noisy_lines, "Z_ERROR(0.04)") != rounds) {
    throw std::runtime_error("Unexpected reset flip channels");
  }

  bool threw = false;
  try {
    const Lattice larger = build_rotated_surface_code(5);
    (void)build_stim_circuit(program, QubitMap(larger));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw) {
    throw std::runtime_error("Mismatched qubit map must be rejected");
  }

  return 0;
}

#include "qsurf/core/errors.h"
#include "qsurf/core/experiment/memory_experiment.h"
#include "qsurf/core/translation/stim_translation.h"

#include <sstream>
#include <stdexcept>
#include <string>

namespace {

using namespace qsurf;

// Which validation step rejected the params.
std::string rejection_of(const MemoryExperimentParams& params) {
  try {
    (void)run_memory_experiment(params);
  } catch (const InvalidDistanceError&) {
    return "distance";
  } catch (const SamplingError&) {
    return "shots";
  } catch (const std::invalid_argument&) {
    return "rounds";
  }
  return "none";
}

}  // namespace

int main() {
  using namespace qsurf;

  const MemoryExperimentParams params("surface_code:rotated_memory_z", 3, 2, NoiseModel(), 5, 7ULL);
  const MemoryExperimentResult result = run_memory_experiment(params);

  if (result.lattice.distance != 3 || result.qubit_map.num_qubits() != 17) {
    throw std::runtime_error("Pipeline must build the d=3 lattice and map");
  }
  if (result.samples.num_shots() != 5 || result.samples.num_records() != 25) {
    throw std::runtime_error("Pipeline must sample 5 shots of 25 records");
  }
  if (result.summary.detector_event_fraction != 0.0 ||
      result.summary.observable_flip_fraction != 0.0) {
    throw std::runtime_error("Noiseless pipeline must report no events");
  }
  if (result.summary.seed != 7 || result.summary.detectors != 16) {
    throw std::runtime_error("Summary must report the seed and detector count");
  }

  std::ostringstream report;
  print_sample_summary(result.summary, report);
  if (report.str().find("Seed: 7") == std::string::npos ||
      report.str().find("after_clifford_depolarization: 0") == std::string::npos) {
    throw std::runtime_error("Printed summary is missing fields");
  }

  // Labels join records with lattice positions.
  const std::vector<MeasurementLabel> labels =
      label_measurements(result.circuits.noiseless, result.qubit_map);
  if (labels.size() != 25 || labels.front().final_readout || !labels.back().final_readout ||
      labels.back().round != 1 || labels.front().role != QubitRole::ANCILLA_X) {
    throw std::runtime_error("Unexpected measurement labels");
  }

  const std::string text = build_stim_circuit(result.circuits.noisy, result.qubit_map);
  if (text.find("QUBIT_COORDS") == std::string::npos) {
    throw std::runtime_error("Exported circuit must carry qubit coordinates");
  }

  // Validation runs distance, rounds, shots in that order.
  if (rejection_of(MemoryExperimentParams(MemoryTask::MEMORY_X, 4, 0, NoiseModel(), 0)) !=
          "distance" ||
      rejection_of(MemoryExperimentParams(MemoryTask::MEMORY_X, 3, 0, NoiseModel(), 0)) !=
          "rounds" ||
      rejection_of(MemoryExperimentParams(MemoryTask::MEMORY_X, 3, 1, NoiseModel(), 0)) != "shots") {
    throw std::runtime_error("Validation order must be distance, rounds, shots");
  }

  bool threw = false;
  try {
    const MemoryExperimentParams bad("memory_y", 3, 1, NoiseModel(), 1);
    (void)bad;
  } catch (const UnsupportedTaskError&) {
    threw = true;
  }
  if (!threw) {
    throw std::runtime_error("Expected UnsupportedTaskError for memory_y");
  }

  return 0;
}

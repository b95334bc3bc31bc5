#include "qsurf/core/sim/analysis.h"

#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace qsurf {

namespace {

std::uint8_t record_parity(const std::vector<std::uint32_t>& records,
                           const std::vector<std::uint8_t>& shot) {
  std::uint8_t parity = 0;
  for (const std::uint32_t record : records) {
    if (record >= shot.size()) {
      throw std::out_of_range("Record index " + std::to_string(record) +
                              " exceeds sampled record count " + std::to_string(shot.size()));
    }
    parity ^= static_cast<std::uint8_t>(shot[record] & 1U);
  }
  return parity;
}

std::uint8_t reference_observable(const CircuitProgram& program, const SampleResult& result) {
  if (!result.reference.has_value() || result.reference->empty()) {
    return 0;
  }
  return record_parity(program.observable(), result.reference->front());
}

}  // namespace

std::vector<MeasurementLabel> label_measurements(const CircuitProgram& program,
                                                 const QubitMap& qubit_map) {
  if (program.num_qubits() != qubit_map.num_qubits()) {
    throw std::invalid_argument("Program and qubit map disagree on qubit count");
  }
  std::vector<MeasurementLabel> labels;
  labels.reserve(program.num_measurements());

  const std::vector<MeasurementRecord>& records = program.measurement_records();
  for (std::size_t i = 0; i < records.size(); ++i) {
    const Qubit& qubit = qubit_map.qubit(records[i].qubit);
    labels.push_back(MeasurementLabel{i, qubit.index, qubit.coord, qubit.role, records[i].round,
                                      qubit.role == QubitRole::DATA});
  }
  return labels;
}

BitMatrix detector_parities(const CircuitProgram& program, const BitMatrix& measurements) {
  BitMatrix out;
  out.reserve(measurements.size());
  for (const std::vector<std::uint8_t>& shot : measurements) {
    std::vector<std::uint8_t> row;
    row.reserve(program.num_detectors());
    for (const std::vector<std::uint32_t>& detector : program.detectors()) {
      row.push_back(record_parity(detector, shot));
    }
    out.push_back(std::move(row));
  }
  return out;
}

std::vector<std::uint8_t> observable_values(const CircuitProgram& program,
                                            const BitMatrix& measurements) {
  std::vector<std::uint8_t> out;
  out.reserve(measurements.size());
  for (const std::vector<std::uint8_t>& shot : measurements) {
    out.push_back(record_parity(program.observable(), shot));
  }
  return out;
}

BitMatrix flip_events(const BitMatrix& measurements, const BitMatrix& reference) {
  if (measurements.size() != reference.size()) {
    throw std::invalid_argument("Measurement and reference shot counts differ");
  }
  BitMatrix out(measurements.size());
  for (std::size_t s = 0; s < measurements.size(); ++s) {
    if (measurements[s].size() != reference[s].size()) {
      throw std::invalid_argument("Measurement and reference record counts differ in shot " +
                                  std::to_string(s));
    }
    out[s].resize(measurements[s].size());
    for (std::size_t m = 0; m < measurements[s].size(); ++m) {
      out[s][m] = static_cast<std::uint8_t>((measurements[s][m] ^ reference[s][m]) & 1U);
    }
  }
  return out;
}

SampleSummary summarize(const NoisyCircuitProgram& noisy_program, const SampleResult& result) {
  // Detectors and the observable are shared by both programs.
  const CircuitProgram& program = noisy_program.noiseless;
  SampleSummary summary;
  summary.error_rates = noisy_program.noise.values();
  summary.shots = result.num_shots();
  summary.records = program.num_measurements();
  summary.detectors = program.num_detectors();
  summary.seed = result.seed;
  summary.seed_from_entropy = result.seed_from_entropy;
  summary.has_reference = result.reference.has_value();
  if (summary.shots == 0) {
    return summary;
  }

  const BitMatrix parities = detector_parities(program, result.measurements);
  std::size_t fired = 0;
  for (const std::vector<std::uint8_t>& row : parities) {
    for (const std::uint8_t bit : row) {
      fired += bit;
    }
  }
  if (summary.detectors > 0) {
    summary.detector_event_fraction =
        static_cast<double>(fired) / static_cast<double>(summary.shots * summary.detectors);
  }

  const std::uint8_t expected = reference_observable(program, result);
  std::size_t observable_flips = 0;
  for (const std::uint8_t value : observable_values(program, result.measurements)) {
    observable_flips += (value != expected) ? 1 : 0;
  }
  summary.observable_flip_fraction =
      static_cast<double>(observable_flips) / static_cast<double>(summary.shots);

  if (summary.has_reference && summary.records > 0) {
    std::size_t mismatches = 0;
    for (const std::vector<std::uint8_t>& row : flip_events(result.measurements, *result.reference)) {
      for (const std::uint8_t bit : row) {
        mismatches += bit;
      }
    }
    summary.reference_mismatch_fraction =
        static_cast<double>(mismatches) / static_cast<double>(summary.shots * summary.records);
  }
  return summary;
}

void print_sample_summary(const SampleSummary& summary, std::ostream& out) {
  out << "Shots: " << summary.shots << "\n";
  out << "MeasurementRecords: " << summary.records << "\n";
  out << "Detectors: " << summary.detectors << "\n";
  out << "Seed: " << summary.seed << (summary.seed_from_entropy ? " (entropy)" : "") << "\n";
  for (std::size_t c = 0; c < summary.error_rates.size(); ++c) {
    out << NoiseModel::to_string(static_cast<NoiseChannel>(c)) << ": " << summary.error_rates[c]
        << "\n";
  }
  out << "DetectorEventFraction: " << summary.detector_event_fraction << "\n";
  out << "ObservableFlipFraction: " << summary.observable_flip_fraction << "\n";
  if (summary.has_reference) {
    out << "ReferenceMismatchFraction: " << summary.reference_mismatch_fraction << "\n";
  } else {
    out << "ReferenceMismatchFraction: n/a (reference skipped)\n";
  }
}

}  // namespace qsurf

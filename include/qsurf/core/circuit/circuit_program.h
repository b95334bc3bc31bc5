#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "qsurf/core/circuit/instruction.h"

namespace qsurf {

// One classical bit produced by a measurement instruction.
struct MeasurementRecord {
  std::uint32_t qubit;

  // Index of the extraction round the measurement belongs to. The final data readout carries
  // the index of the last round.
  std::size_t round;
};

// Ordered instruction sequence over qubits [0, num_qubits).
//
// Appending keeps three side tables consistent with the instructions:
// - one MeasurementRecord per measured target, in execution order,
// - detectors as lists of absolute record indices,
// - the logical observable as a list of absolute record indices.
// Qubits are referenced by index only.
class CircuitProgram {
 public:
  CircuitProgram() = default;
  explicit CircuitProgram(std::size_t num_qubits);

  // Fast append
  void append(OpCode op, const std::vector<std::uint32_t>& targets, double arg = 0.0);

  // Safe append with string
  void safe_append(const std::string& op, const std::vector<std::uint32_t>& targets,
                   double arg = 0.0);

  const std::vector<Instruction>& instructions() const noexcept { return instructions_; }

  std::size_t num_qubits() const noexcept { return num_qubits_; }
  std::size_t num_measurements() const noexcept { return records_.size(); }
  std::size_t num_detectors() const noexcept { return detectors_.size(); }

  // Number of ROUND markers appended so far.
  std::size_t num_rounds() const noexcept { return num_rounds_; }

  const std::vector<MeasurementRecord>& measurement_records() const noexcept { return records_; }
  const std::vector<std::vector<std::uint32_t>>& detectors() const noexcept { return detectors_; }
  const std::vector<std::uint32_t>& observable() const noexcept { return observable_; }

  // Debug helper
  void print_summary(std::ostream& out) const;

 private:
  std::size_t num_qubits_ = 0;
  std::size_t num_rounds_ = 0;

  std::vector<Instruction> instructions_;
  std::vector<MeasurementRecord> records_;
  std::vector<std::vector<std::uint32_t>> detectors_;
  std::vector<std::uint32_t> observable_;

  void validate_instruction_(OpCode op, const std::vector<std::uint32_t>& targets,
                             double arg) const;
};

}  // namespace qsurf

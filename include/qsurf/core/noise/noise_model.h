#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace qsurf {

// Injection points of the circuit-level noise model.
enum class NoiseChannel : std::size_t {
  kAfterCliffordDepolarization = 0,
  kBeforeRoundDataDepolarization,
  kBeforeMeasureFlipProbability,
  kAfterResetFlipProbability,
  kCount,
};

// Four independent error probabilities indexed by NoiseChannel, each in [0, 1].
//
// A value object: probabilities are fixed at construction and validated there.
// `with_probability` returns a modified copy. All channels default to 0 (noiseless).
class NoiseModel {
 public:
  using Values = std::array<double, static_cast<std::size_t>(NoiseChannel::kCount)>;

  NoiseModel();
  NoiseModel(double after_clifford_depolarization, double before_round_data_depolarization,
             double before_measure_flip_probability, double after_reset_flip_probability);

  double get(NoiseChannel channel) const;
  double get(const std::string& channel) const;

  NoiseModel with_probability(NoiseChannel channel, double prob) const;
  NoiseModel with_probability(const std::string& channel, double prob) const;

  const Values& values() const noexcept { return probabilities_; }
  bool is_noiseless() const noexcept;

  // Canonical configuration keys, e.g. "after_clifford_depolarization".
  static std::string_view to_string(NoiseChannel channel);
  static NoiseChannel from_string(const std::string& channel);

 private:
  // Probability vector indexed by NoiseChannel values.
  Values probabilities_{};

  static std::size_t to_index(NoiseChannel channel);
  static void validate_probability(NoiseChannel channel, double prob);
};

}  // namespace qsurf

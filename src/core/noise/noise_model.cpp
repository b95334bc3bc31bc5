#include "qsurf/core/noise/noise_model.h"

#include <array>
#include <stdexcept>

#include "qsurf/core/errors.h"

namespace qsurf {
namespace {

// Canonical text keys used by configuration collaborators and Python wrappers.
constexpr std::array<std::string_view, static_cast<std::size_t>(NoiseChannel::kCount)> kChannelNames = {
    "after_clifford_depolarization",
    "before_round_data_depolarization",
    "before_measure_flip_probability",
    "after_reset_flip_probability",
};

}  // namespace

NoiseModel::NoiseModel() {
  // Start from a noiseless model unless caller opts in.
  probabilities_.fill(0.0);
}

NoiseModel::NoiseModel(double after_clifford_depolarization, double before_round_data_depolarization,
                       double before_measure_flip_probability, double after_reset_flip_probability)
    : probabilities_{after_clifford_depolarization, before_round_data_depolarization,
                     before_measure_flip_probability, after_reset_flip_probability} {
  for (std::size_t i = 0; i < probabilities_.size(); ++i) {
    validate_probability(static_cast<NoiseChannel>(i), probabilities_[i]);
  }
}

void NoiseModel::validate_probability(NoiseChannel channel, double prob) {
  // Negated comparison also rejects NaN.
  if (!(prob >= 0.0 && prob <= 1.0)) {
    throw InvalidProbabilityError(std::string(to_string(channel)), prob);
  }
}

std::size_t NoiseModel::to_index(NoiseChannel channel) {
  const std::size_t idx = static_cast<std::size_t>(channel);
  if (idx >= kChannelNames.size()) {
    throw std::invalid_argument("Invalid noise channel enum value");
  }
  return idx;
}

double NoiseModel::get(NoiseChannel channel) const {
  return probabilities_[to_index(channel)];
}

double NoiseModel::get(const std::string& channel) const {
  return get(from_string(channel));
}

NoiseModel NoiseModel::with_probability(NoiseChannel channel, double prob) const {
  const std::size_t idx = to_index(channel);
  validate_probability(channel, prob);
  NoiseModel out = *this;
  out.probabilities_[idx] = prob;
  return out;
}

NoiseModel NoiseModel::with_probability(const std::string& channel, double prob) const {
  return with_probability(from_string(channel), prob);
}

bool NoiseModel::is_noiseless() const noexcept {
  for (const double p : probabilities_) {
    if (p != 0.0) {
      return false;
    }
  }
  return true;
}

std::string_view NoiseModel::to_string(NoiseChannel channel) {
  return kChannelNames[to_index(channel)];
}

NoiseChannel NoiseModel::from_string(const std::string& channel) {
  for (std::size_t i = 0; i < kChannelNames.size(); ++i) {
    if (channel == kChannelNames[i]) {
      return static_cast<NoiseChannel>(i);
    }
  }
  throw std::invalid_argument("Invalid noise parameter channel: " + channel);
}

}  // namespace qsurf

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

#include "qsurf/core/code/coordinate.h"

namespace qsurf {

// Code distance is even or smaller than 3. Raised before any circuit work is done.
class InvalidDistanceError : public std::invalid_argument {
 public:
  explicit InvalidDistanceError(std::size_t distance);

  std::size_t distance() const noexcept { return distance_; }

 private:
  std::size_t distance_;
};

// Task selector does not name a supported memory experiment.
class UnsupportedTaskError : public std::invalid_argument {
 public:
  explicit UnsupportedTaskError(const std::string& task);

  const std::string& task() const noexcept { return task_; }

 private:
  std::string task_;
};

// An error probability lies outside [0, 1].
class InvalidProbabilityError : public std::invalid_argument {
 public:
  InvalidProbabilityError(const std::string& channel, double probability);

  const std::string& channel() const noexcept { return channel_; }
  double probability() const noexcept { return probability_; }

 private:
  std::string channel_;
  double probability_;
};

// Sampling was requested with a non-positive shot count.
class SamplingError : public std::invalid_argument {
 public:
  explicit SamplingError(long long shots);

  long long shots() const noexcept { return shots_; }

 private:
  long long shots_;
};

// The qubit mapper visited the same lattice coordinate twice. Indicates a broken lattice.
class DuplicateAssignmentError : public std::logic_error {
 public:
  explicit DuplicateAssignmentError(const Coordinate& coordinate);

  const Coordinate& coordinate() const noexcept { return coordinate_; }

 private:
  Coordinate coordinate_;
};

}  // namespace qsurf

#include "qsurf/core/errors.h"

#include <string>

namespace qsurf {

InvalidDistanceError::InvalidDistanceError(std::size_t distance)
    : std::invalid_argument("Distance must be an odd integer greater than or equal to 3, got " +
                            std::to_string(distance)),
      distance_(distance) {}

UnsupportedTaskError::UnsupportedTaskError(const std::string& task)
    : std::invalid_argument("Unsupported task '" + task +
                            "', expected memory_x, memory_z, surface_code:rotated_memory_x or "
                            "surface_code:rotated_memory_z"),
      task_(task) {}

InvalidProbabilityError::InvalidProbabilityError(const std::string& channel, double probability)
    : std::invalid_argument("Probability for " + channel + " must be between 0 and 1, got " +
                            std::to_string(probability)),
      channel_(channel),
      probability_(probability) {}

SamplingError::SamplingError(long long shots)
    : std::invalid_argument("Number of shots must be greater than 0, got " + std::to_string(shots)),
      shots_(shots) {}

DuplicateAssignmentError::DuplicateAssignmentError(const Coordinate& coordinate)
    : std::logic_error("Qubit mapping visited coordinate " + to_string(coordinate) +
                       " more than once"),
      coordinate_(coordinate) {}

}  // namespace qsurf

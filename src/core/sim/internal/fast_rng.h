#pragma once

#include <cstddef>
#include <cstdint>

namespace qsurf::internal {

inline std::uint64_t splitmix64_next(std::uint64_t* state) {
  std::uint64_t z = (*state += 0x9E3779B97F4A7C15ULL);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

// Seed for one independent stream of a seeded run. Depends only on (seed, stream), never on
// how streams are distributed across workers.
inline std::uint64_t stream_seed(std::uint64_t seed, std::size_t stream) {
  std::uint64_t state = seed ^ (0xD1B54A32D192ED03ULL * (static_cast<std::uint64_t>(stream) + 1));
  splitmix64_next(&state);
  return splitmix64_next(&state);
}

}  // namespace qsurf::internal

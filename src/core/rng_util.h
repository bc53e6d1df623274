/**
 * @file rng_util.h
 * @brief Random selection helpers shared by the sampler and the facade.
 */

#ifndef CHORDLAB_CORE_RNG_UTIL_H
#define CHORDLAB_CORE_RNG_UTIL_H

#include <chrono>
#include <cstdint>
#include <random>

namespace chordlab {
namespace rng_util {

/// @brief Select a random index from a container, every index equally likely.
/// @param rng Random engine
/// @param container Non-empty container
/// @return Random index in [0, container.size() - 1]
template <typename Container>
inline size_t selectRandomIndex(std::mt19937& rng, const Container& container) {
  std::uniform_int_distribution<size_t> dist(0, container.size() - 1);
  return dist(rng);
}

/// @brief Select a random element from a const container.
/// @param rng Random engine
/// @param container Non-empty container with random access
/// @return Const reference to a randomly selected element
template <typename Container>
inline const auto& selectRandom(std::mt19937& rng, const Container& container) {
  return container[selectRandomIndex(rng, container)];
}

/// @brief Resolve a user seed; 0 means derive one from the clock.
/// @param seed Fixed seed, or 0 for a non-deterministic one
/// @return The seed actually used
inline uint32_t resolveSeed(uint32_t seed) {
  if (seed == 0) {
    return static_cast<uint32_t>(std::chrono::steady_clock::now().time_since_epoch().count());
  }
  return seed;
}

}  // namespace rng_util
}  // namespace chordlab

#endif  // CHORDLAB_CORE_RNG_UTIL_H

#pragma once
/**
 * @file deterministic.hpp
 * @brief Deterministic computing utilities for reproducible frames
 *
 * This header provides:
 * - Xoshiro256** RNG for reproducible background textures
 * - FNV-1a hashing for frame validation
 *
 * All functions are inline for maximum optimization.
 */

#include <array>
#include <cmath>
#include <cstdint>
#include <span>

namespace LectureEngine::Deterministic {

// ============================================================================
// Deterministic RNG (Xoshiro256**)
// ============================================================================

/**
 * @brief High-quality, fast PRNG with deterministic output
 *
 * Same seed = same sequence on every platform, which is what keeps the
 * blackboard background (and therefore every frame hash) stable.
 */
class DeterministicRNG {
public:
  /// Initialize with seed
  explicit DeterministicRNG(uint64_t seed) noexcept {
    // Use splitmix64 to expand single seed to full state
    state_[0] = splitmix64(seed);
    state_[1] = splitmix64(seed);
    state_[2] = splitmix64(seed);
    state_[3] = splitmix64(seed);
  }

  /// Generate next 64-bit random value
  [[nodiscard]] uint64_t next() noexcept {
    const uint64_t result = rotl(state_[1] * 5, 7) * 9;
    const uint64_t t = state_[1] << 17;

    state_[2] ^= state_[0];
    state_[3] ^= state_[1];
    state_[1] ^= state_[2];
    state_[0] ^= state_[3];

    state_[2] ^= t;
    state_[3] = rotl(state_[3], 45);

    return result;
  }

  /// Generate random double in [0, 1)
  [[nodiscard]] double next_double() noexcept {
    return static_cast<double>(next() >> 11) * 0x1.0p-53;
  }

  /// Standard normal sample (Box-Muller, one value per call)
  [[nodiscard]] double next_gaussian() noexcept {
    double u1 = next_double();
    const double u2 = next_double();
    if (u1 < 1e-300)
      u1 = 1e-300;
    return std::sqrt(-2.0 * std::log(u1)) *
           std::cos(2.0 * 3.14159265358979323846 * u2);
  }

private:
  std::array<uint64_t, 4> state_;

  /// Rotate left helper
  [[nodiscard]] static constexpr uint64_t rotl(uint64_t x, int k) noexcept {
    return (x << k) | (x >> (64 - k));
  }

  /// Splitmix64 for seed expansion
  [[nodiscard]] static uint64_t splitmix64(uint64_t &x) noexcept {
    uint64_t z = (x += 0x9e3779b97f4a7c15ULL);
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
  }
};

// ============================================================================
// Hashing
// ============================================================================

inline constexpr uint64_t FNV_OFFSET = 14695981039346656037ULL;
inline constexpr uint64_t FNV_PRIME = 1099511628211ULL;

/**
 * @brief FNV-1a 64-bit hash
 *
 * Fast, deterministic hash suitable for frame validation.
 */
[[nodiscard]] inline uint64_t
compute_pixel_hash(std::span<const uint8_t> pixels) noexcept {
  uint64_t hash = FNV_OFFSET;
  for (uint8_t byte : pixels) {
    hash ^= byte;
    hash *= FNV_PRIME;
  }
  return hash;
}

/**
 * @brief Combine multiple hashes
 */
[[nodiscard]] constexpr uint64_t combine_hashes(uint64_t h1,
                                                uint64_t h2) noexcept {
  return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
}

} // namespace LectureEngine::Deterministic

#ifndef REPRO_RNG_HPP
#define REPRO_RNG_HPP

#include <cstdint>

namespace repro {

inline constexpr uint64_t kDefaultSeed = 88172645463393265ull;

// SplitMix64 finalizer; spreads nearby user seeds over the whole state space.
inline constexpr uint64_t splitmix64(uint64_t x) {
  x += 0x9E3779B97F4A7C15ull;
  x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
  x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
  return x ^ (x >> 31);
}

// Tiny xorshift64* RNG for portability (not cryptographic).
// Backs the tensor-computation streams; the whole state is one word.
struct RNG {
  uint64_t state;
  explicit RNG(uint64_t s = kDefaultSeed) : state(s ? s : kDefaultSeed) {}

  // Reseed from a user seed. Zero state is a fixed point of xorshift, so it is remapped.
  inline void manual_seed(uint64_t seed) {
    const uint64_t s = splitmix64(seed);
    state = s ? s : kDefaultSeed;
  }
  inline uint64_t next_u64() {
    uint64_t x = state;
    x ^= x >> 12;
    x ^= x << 25;
    x ^= x >> 27;
    state = x;
    return x * 2685821657736338717ull;
  }
  inline double next_uniform01() {
    // 53-bit mantissa -> [0,1)
    return (next_u64() >> 11) * (1.0/9007199254740992.0);
  }
};

} // namespace repro

#endif // REPRO_RNG_HPP

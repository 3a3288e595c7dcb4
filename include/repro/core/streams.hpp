#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "repro/core/rng.hpp"

// Process-wide ambient random streams. One instance of each per process
// (plus one tensor stream per accelerator device); not thread-safe.

namespace repro {

// Opaque serialized engine state. Only the stream that produced it can read it.
using StateBlob = std::string;

// General-purpose stream (64-bit Mersenne Twister).
namespace general {
StateBlob get_state();
void set_state(const StateBlob& state);
// nullopt seeds from platform entropy.
void seed(std::optional<std::int64_t> seed);
// Uniform integer in [lo, hi], both inclusive.
std::int64_t randint(std::int64_t lo, std::int64_t hi);
double random();
} // namespace general

// Numeric-array stream (32-bit Mersenne Twister).
namespace numeric {
StateBlob get_state();
void set_state(const StateBlob& state);
void seed(std::optional<std::int64_t> seed);
std::uint32_t next_u32();
double uniform();
} // namespace numeric

// Simulated accelerator registry. Initial count comes from REPRO_NUM_DEVICES.
namespace device {
std::size_t count();
// Growing adds devices whose streams start at the default seed; shrinking drops streams.
void set_count(std::size_t n);
} // namespace device

// Tensor-computation streams: one CPU generator and one per device.
namespace tensor {
StateBlob get_rng_state();
void set_rng_state(const StateBlob& state);
StateBlob get_device_rng_state(std::size_t device);
void set_device_rng_state(const StateBlob& state, std::size_t device);
// Reseeds the CPU generator and every device generator.
void manual_seed(std::uint64_t seed);
RNG& cpu_generator();
RNG& device_generator(std::size_t device);
} // namespace tensor

} // namespace repro

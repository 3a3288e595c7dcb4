#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "repro/core/backend.hpp"
#include "repro/random/random_context.hpp"

namespace repro {

struct RandomizationConfig {
  // Seed for RNG used in shuffling the training data.
  std::optional<std::int64_t> data_seed;
  // Seed for RNG used in initializing the model.
  std::optional<std::int64_t> init_seed;
  // Seed for RNG used in computing the model's training loss.
  // Only relevant with internal randomness in the model, e.g. with dropout.
  std::optional<std::int64_t> model_seed;

  // REPRO_DATA_SEED / REPRO_INIT_SEED / REPRO_MODEL_SEED; unset or "none" -> unspecified.
  static RandomizationConfig from_env();
  // All three keys are required (std::out_of_range otherwise); extra keys are ignored.
  static RandomizationConfig from_map(const std::map<std::string, std::optional<std::int64_t>>& m);
};

// One independent context per randomness consumer of a training run.
struct Reproducible {
  RandomContext data_random;
  RandomContext model_random;
  RandomContext init_random;

  explicit Reproducible(const RandomizationConfig& config,
                        RngBackend& backend = default_backend());
};

} // namespace repro

#include "repro/random/reproducible.hpp"
#include "repro/core/env.hpp"

#include <stdexcept>

namespace repro {

RandomizationConfig RandomizationConfig::from_env() {
  RandomizationConfig c;
  c.data_seed  = env::get_seed("REPRO_DATA_SEED");
  c.init_seed  = env::get_seed("REPRO_INIT_SEED");
  c.model_seed = env::get_seed("REPRO_MODEL_SEED");
  return c;
}

RandomizationConfig RandomizationConfig::from_map(
    const std::map<std::string, std::optional<std::int64_t>>& m) {
  auto get = [&](const char* key) {
    auto it = m.find(key);
    if (it == m.end()) throw std::out_of_range(std::string("RandomizationConfig: missing key '") + key + "'");
    return it->second;
  };
  RandomizationConfig c;
  c.data_seed  = get("data_seed");
  c.init_seed  = get("init_seed");
  c.model_seed = get("model_seed");
  return c;
}

Reproducible::Reproducible(const RandomizationConfig& config, RngBackend& backend)
  : data_random(config.data_seed, backend),
    model_random(config.model_seed, backend),
    init_random(config.init_seed, backend) {}

} // namespace repro

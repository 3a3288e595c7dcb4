#include "repro/core/backend.hpp"

namespace repro {

StateBlob GlobalBackend::general_state() { return general::get_state(); }
void GlobalBackend::set_general_state(const StateBlob& s) { general::set_state(s); }
void GlobalBackend::seed_general(std::optional<std::int64_t> seed) { general::seed(seed); }
std::int64_t GlobalBackend::general_randint(std::int64_t lo, std::int64_t hi) {
  return general::randint(lo, hi);
}

StateBlob GlobalBackend::numeric_state() { return numeric::get_state(); }
void GlobalBackend::set_numeric_state(const StateBlob& s) { numeric::set_state(s); }
void GlobalBackend::seed_numeric(std::optional<std::int64_t> seed) { numeric::seed(seed); }

StateBlob GlobalBackend::tensor_cpu_state() { return tensor::get_rng_state(); }
void GlobalBackend::set_tensor_cpu_state(const StateBlob& s) { tensor::set_rng_state(s); }
StateBlob GlobalBackend::tensor_device_state(std::size_t d) { return tensor::get_device_rng_state(d); }
void GlobalBackend::set_tensor_device_state(const StateBlob& s, std::size_t d) {
  tensor::set_device_rng_state(s, d);
}
void GlobalBackend::seed_tensor(std::uint64_t seed) { tensor::manual_seed(seed); }

std::size_t GlobalBackend::device_count() { return device::count(); }

GlobalBackend& default_backend() {
  static GlobalBackend b;
  return b;
}

} // namespace repro

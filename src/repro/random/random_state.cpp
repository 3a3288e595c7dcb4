#include "repro/random/random_state.hpp"
#include "repro/core/errors.hpp"
#include "repro/core/trace.hpp"

namespace repro {

RandomState::RandomState(RngBackend& backend)
  : backend_(&backend),
    general_(backend.general_state()),
    numeric_(backend.numeric_state()),
    tensor_cpu_(backend.tensor_cpu_state()) {
  const std::size_t n = backend.device_count();
  tensor_devices_.reserve(n);
  for (std::size_t d = 0; d < n; ++d) tensor_devices_.push_back(backend.tensor_device_state(d));
}

void RandomState::restore() const {
  const std::size_t available = backend_->device_count();
  if (tensor_devices_.size() > available) {
    trace("restore refused: %zu device state(s) captured, %zu device(s) available",
          tensor_devices_.size(), available);
    throw DeviceTopologyMismatchError(tensor_devices_.size(), available);
  }
  backend_->set_general_state(general_);
  backend_->set_numeric_state(numeric_);
  backend_->set_tensor_cpu_state(tensor_cpu_);
  for (std::size_t d = 0; d < tensor_devices_.size(); ++d) {
    backend_->set_tensor_device_state(tensor_devices_[d], d);
  }
}

} // namespace repro

#pragma once
#include <cstddef>
#include <vector>

#include "repro/core/backend.hpp"

namespace repro {

// Snapshot of every tracked stream at one instant. Immutable after capture.
class RandomState {
public:
  // Capture order: general, numeric, tensor CPU, tensor device 0..N-1.
  // N is read from the backend now.
  explicit RandomState(RngBackend& backend = default_backend());

  // Write the captured states back in capture order. Throws
  // DeviceTopologyMismatchError, before touching any stream, if fewer
  // devices are present than were captured.
  void restore() const;

  const StateBlob& general_state() const { return general_; }
  const StateBlob& numeric_state() const { return numeric_; }
  const StateBlob& tensor_cpu_state() const { return tensor_cpu_; }
  const std::vector<StateBlob>& tensor_device_states() const { return tensor_devices_; }
  std::size_t device_count() const { return tensor_devices_.size(); }

  bool operator==(const RandomState& o) const {
    return general_ == o.general_ && numeric_ == o.numeric_ &&
           tensor_cpu_ == o.tensor_cpu_ && tensor_devices_ == o.tensor_devices_;
  }
  bool operator!=(const RandomState& o) const { return !(*this == o); }

private:
  RngBackend* backend_;
  StateBlob general_;
  StateBlob numeric_;
  StateBlob tensor_cpu_;
  std::vector<StateBlob> tensor_devices_;
};

} // namespace repro

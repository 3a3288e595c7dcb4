#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>

namespace repro {

// Raised by RandomContext::enter() when the same instance is already active.
struct AlreadyActiveError : std::logic_error {
  AlreadyActiveError()
    : std::logic_error("RandomContext can be active only once") {}
};

// Raised when a per-device state refers to a device ordinal the
// environment no longer exposes.
struct DeviceTopologyMismatchError : std::out_of_range {
  std::size_t captured;   // devices recorded in the state
  std::size_t available;  // devices present now

  DeviceTopologyMismatchError(std::size_t captured_devices, std::size_t available_devices)
    : std::out_of_range("device topology changed: state holds " +
                        std::to_string(captured_devices) + " device(s), " +
                        std::to_string(available_devices) + " available"),
      captured(captured_devices), available(available_devices) {}
};

} // namespace repro

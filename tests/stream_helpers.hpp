// tests/stream_helpers.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "repro/core/streams.hpp"

namespace tfw {

// Pins the simulated device count for one test and puts it back afterwards.
struct DeviceCountGuard {
  std::size_t prev;
  explicit DeviceCountGuard(std::size_t n) : prev(repro::device::count()) { repro::device::set_count(n); }
  ~DeviceCountGuard() { repro::device::set_count(prev); }
  DeviceCountGuard(const DeviceCountGuard&) = delete;
  DeviceCountGuard& operator=(const DeviceCountGuard&) = delete;
};

// Values drawn from every ambient stream, in a fixed interleaving.
struct Draws {
  std::vector<double> general;
  std::vector<std::uint32_t> numeric;
  std::vector<std::uint64_t> cpu;
  std::vector<std::vector<std::uint64_t>> devices;

  bool operator==(const Draws& o) const {
    return general == o.general && numeric == o.numeric && cpu == o.cpu && devices == o.devices;
  }
  bool operator!=(const Draws& o) const { return !(*this == o); }

  void append(const Draws& o) {
    general.insert(general.end(), o.general.begin(), o.general.end());
    numeric.insert(numeric.end(), o.numeric.begin(), o.numeric.end());
    cpu.insert(cpu.end(), o.cpu.begin(), o.cpu.end());
    if (devices.size() < o.devices.size()) devices.resize(o.devices.size());
    for (std::size_t d = 0; d < o.devices.size(); ++d)
      devices[d].insert(devices[d].end(), o.devices[d].begin(), o.devices[d].end());
  }
};

inline Draws draw(std::size_t n) {
  Draws out;
  const std::size_t nd = repro::device::count();
  out.devices.resize(nd);
  for (std::size_t i = 0; i < n; ++i) {
    out.general.push_back(repro::general::random());
    out.numeric.push_back(repro::numeric::next_u32());
    out.cpu.push_back(repro::tensor::cpu_generator().next_u64());
    for (std::size_t d = 0; d < nd; ++d)
      out.devices[d].push_back(repro::tensor::device_generator(d).next_u64());
  }
  return out;
}

} // namespace tfw

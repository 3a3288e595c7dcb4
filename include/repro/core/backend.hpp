#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>

#include "repro/core/streams.hpp"

namespace repro {

// Capability interface over every tracked random stream. Snapshots and
// contexts act on a backend, never on the globals directly.
class RngBackend {
public:
  virtual ~RngBackend() = default;

  virtual StateBlob general_state() = 0;
  virtual void set_general_state(const StateBlob& state) = 0;
  virtual void seed_general(std::optional<std::int64_t> seed) = 0;
  virtual std::int64_t general_randint(std::int64_t lo, std::int64_t hi) = 0;

  virtual StateBlob numeric_state() = 0;
  virtual void set_numeric_state(const StateBlob& state) = 0;
  virtual void seed_numeric(std::optional<std::int64_t> seed) = 0;

  virtual StateBlob tensor_cpu_state() = 0;
  virtual void set_tensor_cpu_state(const StateBlob& state) = 0;
  virtual StateBlob tensor_device_state(std::size_t device) = 0;
  virtual void set_tensor_device_state(const StateBlob& state, std::size_t device) = 0;
  // Must reseed the CPU stream and all device streams.
  virtual void seed_tensor(std::uint64_t seed) = 0;

  virtual std::size_t device_count() = 0;
};

// Backend over the process-wide streams in streams.hpp.
class GlobalBackend final : public RngBackend {
public:
  StateBlob general_state() override;
  void set_general_state(const StateBlob& state) override;
  void seed_general(std::optional<std::int64_t> seed) override;
  std::int64_t general_randint(std::int64_t lo, std::int64_t hi) override;

  StateBlob numeric_state() override;
  void set_numeric_state(const StateBlob& state) override;
  void seed_numeric(std::optional<std::int64_t> seed) override;

  StateBlob tensor_cpu_state() override;
  void set_tensor_cpu_state(const StateBlob& state) override;
  StateBlob tensor_device_state(std::size_t device) override;
  void set_tensor_device_state(const StateBlob& state, std::size_t device) override;
  void seed_tensor(std::uint64_t seed) override;

  std::size_t device_count() override;
};

GlobalBackend& default_backend();

} // namespace repro

#include "repro/random/random_context.hpp"
#include "repro/core/errors.hpp"
#include "repro/core/trace.hpp"

#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace repro {
namespace {

std::string seed_str(const std::optional<std::int64_t>& seed) {
  return seed ? std::to_string(*seed) : std::string("none");
}

} // namespace

RandomState RandomContext::derive_inside(std::optional<std::int64_t> seed, RngBackend& backend) {
  RandomState outside(backend);

  std::optional<RandomState> inside;
  try {
    backend.seed_general(seed);
    backend.seed_numeric(seed);
    if (seed) {
      backend.seed_tensor(static_cast<std::uint64_t>(*seed));
    } else {
      // Drawn from the general stream after its reseed, so the tensor seed is
      // reproducible relative to it.
      const std::int64_t derived = backend.general_randint(std::numeric_limits<std::int64_t>::min(),
                                                           std::numeric_limits<std::int64_t>::max());
      backend.seed_tensor(static_cast<std::uint64_t>(derived));
    }
    inside.emplace(backend);
  } catch (...) {
    outside.restore();
    throw;
  }

  outside.restore();
  return std::move(*inside);
}

RandomContext::RandomContext(std::optional<std::int64_t> seed, RngBackend& backend)
  : backend_(&backend), seed_(seed), inside_(derive_inside(seed, backend)) {
  trace("context %p created (seed=%s, devices=%zu)", static_cast<void*>(this),
        seed_str(seed_).c_str(), inside_.device_count());
}

void RandomContext::enter() {
  if (active_) {
    trace("context %p: enter while active", static_cast<void*>(this));
    throw AlreadyActiveError();
  }
  outside_.emplace(*backend_);
  try {
    inside_.restore();
  } catch (...) {
    outside_.reset();
    throw;
  }
  active_ = true;
  trace("context %p entered (seed=%s)", static_cast<void*>(this), seed_str(seed_).c_str());
}

void RandomContext::exit() {
  if (!active_) throw std::logic_error("RandomContext::exit() without a matching enter()");
  inside_ = RandomState(*backend_);

  RandomState outside = std::move(*outside_);
  outside_.reset();
  active_ = false;
  outside.restore();
  trace("context %p exited (seed=%s)", static_cast<void*>(this), seed_str(seed_).c_str());
}

} // namespace repro

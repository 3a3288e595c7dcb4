#pragma once
#include <cstdint>
#include <optional>
#include <type_traits>
#include <utility>

#include "repro/core/backend.hpp"
#include "repro/random/random_state.hpp"

namespace repro {

// Swaps the ambient RNG state for a private, seed-derived one while active,
// and restores the ambient state on exit. State evolved inside one
// activation carries over to the next.
//
//   RandomContext init(1234);
//   {
//     auto s = init.scope();
//     ... draws here follow init's private sequence ...
//   }                         // ambient state restored
class RandomContext {
public:
  class Scope;

  // nullopt seeds general/numeric from platform entropy and the tensor
  // streams from a draw of the freshly seeded general stream.
  // Leaves the ambient state untouched.
  explicit RandomContext(std::optional<std::int64_t> seed = std::nullopt,
                         RngBackend& backend = default_backend());

  RandomContext(const RandomContext&) = delete;
  RandomContext& operator=(const RandomContext&) = delete;

  // Throws AlreadyActiveError if active. If the inside state cannot be
  // restored the error propagates and the context stays inactive.
  void enter();
  // Throws std::logic_error if not active.
  void exit();

  // Enter now; the returned guard exits exactly once.
  [[nodiscard]] Scope scope();

  // Run fn inside the context. Exit happens on both normal and exceptional
  // return; the body's exception is rethrown after exit.
  template <class Fn>
  auto run(Fn&& fn);

  bool active() const { return active_; }
  const std::optional<std::int64_t>& seed() const { return seed_; }
  const RandomState& inside_state() const { return inside_; }

private:
  static RandomState derive_inside(std::optional<std::int64_t> seed, RngBackend& backend);

  RngBackend* backend_;
  std::optional<std::int64_t> seed_;
  RandomState inside_;
  std::optional<RandomState> outside_;
  bool active_ = false;
};

class RandomContext::Scope {
public:
  explicit Scope(RandomContext& ctx) : ctx_(&ctx) { ctx.enter(); }
  Scope(Scope&& o) noexcept : ctx_(std::exchange(o.ctx_, nullptr)) {}
  Scope(const Scope&) = delete;
  Scope& operator=(const Scope&) = delete;
  Scope& operator=(Scope&&) = delete;

  // Exits if still open. A restore failure propagates to the caller; if the
  // scope is already being unwound by another exception it terminates.
  ~Scope() noexcept(false) { if (ctx_) close(); }

  // Exit now, propagating restore errors. No-op if already closed.
  void close() {
    if (!ctx_) return;
    RandomContext* c = std::exchange(ctx_, nullptr);
    c->exit();
  }
  bool open() const { return ctx_ != nullptr; }

private:
  RandomContext* ctx_;
};

inline RandomContext::Scope RandomContext::scope() { return Scope(*this); }

template <class Fn>
auto RandomContext::run(Fn&& fn) {
  Scope s = scope();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn&&>>) {
      std::forward<Fn>(fn)();
      s.close();
    } else {
      auto r = std::forward<Fn>(fn)();
      s.close();
      return r;
    }
  } catch (...) {
    s.close();
    throw;
  }
}

} // namespace repro

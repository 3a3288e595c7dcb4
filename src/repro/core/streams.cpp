#include "repro/core/streams.hpp"
#include "repro/core/env.hpp"
#include "repro/core/errors.hpp"

#include <array>
#include <random>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace repro {
namespace {

std::mt19937_64& general_engine() {
  static std::mt19937_64 e{std::mt19937_64::default_seed};
  return e;
}

std::mt19937& numeric_engine() {
  static std::mt19937 e{std::mt19937::default_seed};
  return e;
}

RNG& cpu_rng() {
  static RNG r{kDefaultSeed};
  return r;
}

std::vector<RNG>& device_rngs() {
  static std::vector<RNG> v(env::get_size("REPRO_NUM_DEVICES", 0), RNG{kDefaultSeed});
  return v;
}

// Both halves of the seed go into the sequence so negative and >32-bit seeds stay distinct.
std::seed_seq seq_from(std::int64_t seed) {
  const auto u = static_cast<std::uint64_t>(seed);
  return std::seed_seq{static_cast<std::uint32_t>(u & 0xFFFFFFFFu),
                       static_cast<std::uint32_t>(u >> 32)};
}

template <class Engine>
void seed_engine(Engine& e, std::optional<std::int64_t> seed) {
  if (seed) {
    auto seq = seq_from(*seed);
    e.seed(seq);
    return;
  }
  std::random_device rd;
  std::array<std::uint32_t, 8> words{};
  for (auto& w : words) w = rd();
  std::seed_seq seq(words.begin(), words.end());
  e.seed(seq);
}

template <class Engine>
StateBlob save_engine(const Engine& e) {
  std::ostringstream os;
  os << e;
  return os.str();
}

// Parses into a temporary first so a bad blob leaves the live engine intact.
template <class Engine>
void load_engine(Engine& e, const StateBlob& state, const char* what) {
  std::istringstream is(state);
  Engine tmp;
  is >> tmp;
  if (is.fail()) throw std::invalid_argument(std::string(what) + ": malformed state");
  is >> std::ws;
  if (!is.eof()) throw std::invalid_argument(std::string(what) + ": trailing data in state");
  e = tmp;
}

StateBlob save_rng(const RNG& r) { return std::to_string(r.state); }

void load_rng(RNG& r, const StateBlob& state, const char* what) {
  if (state.empty() || state.find_first_not_of("0123456789") != StateBlob::npos) {
    throw std::invalid_argument(std::string(what) + ": malformed state");
  }
  uint64_t v = 0;
  try {
    v = std::stoull(state);
  } catch (const std::out_of_range&) {
    throw std::invalid_argument(std::string(what) + ": state out of range");
  }
  if (v == 0) throw std::invalid_argument(std::string(what) + ": zero state");
  r.state = v;
}

void check_device(std::size_t d) {
  const std::size_t n = device_rngs().size();
  if (d >= n) throw DeviceTopologyMismatchError(d + 1, n);
}

} // namespace

// ---------- general ----------
namespace general {

StateBlob get_state() { return save_engine(general_engine()); }
void set_state(const StateBlob& state) { load_engine(general_engine(), state, "general::set_state"); }
void seed(std::optional<std::int64_t> s) { seed_engine(general_engine(), s); }

std::int64_t randint(std::int64_t lo, std::int64_t hi) {
  if (lo > hi) throw std::invalid_argument("general::randint: lo > hi");
  std::uniform_int_distribution<std::int64_t> dist(lo, hi);
  return dist(general_engine());
}

double random() {
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  return dist(general_engine());
}

} // namespace general

// ---------- numeric ----------
namespace numeric {

StateBlob get_state() { return save_engine(numeric_engine()); }
void set_state(const StateBlob& state) { load_engine(numeric_engine(), state, "numeric::set_state"); }
void seed(std::optional<std::int64_t> s) { seed_engine(numeric_engine(), s); }
std::uint32_t next_u32() { return static_cast<std::uint32_t>(numeric_engine()()); }

double uniform() {
  // 53-bit double from two 32-bit draws
  const std::uint32_t a = next_u32() >> 5, b = next_u32() >> 6;
  return (a * 67108864.0 + b) * (1.0 / 9007199254740992.0);
}

} // namespace numeric

// ---------- device ----------
namespace device {

std::size_t count() { return device_rngs().size(); }
void set_count(std::size_t n) { device_rngs().resize(n, RNG{kDefaultSeed}); }

} // namespace device

// ---------- tensor ----------
namespace tensor {

StateBlob get_rng_state() { return save_rng(cpu_rng()); }
void set_rng_state(const StateBlob& state) { load_rng(cpu_rng(), state, "tensor::set_rng_state"); }

StateBlob get_device_rng_state(std::size_t d) {
  check_device(d);
  return save_rng(device_rngs()[d]);
}

void set_device_rng_state(const StateBlob& state, std::size_t d) {
  check_device(d);
  load_rng(device_rngs()[d], state, "tensor::set_device_rng_state");
}

void manual_seed(std::uint64_t seed) {
  cpu_rng().manual_seed(seed);
  for (auto& r : device_rngs()) r.manual_seed(seed);
}

RNG& cpu_generator() { return cpu_rng(); }

RNG& device_generator(std::size_t d) {
  check_device(d);
  return device_rngs()[d];
}

} // namespace tensor

} // namespace repro

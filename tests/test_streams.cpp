// tests/test_streams.cpp
#include "test_framework.hpp"
#include "stream_helpers.hpp"

#include <limits>
#include <stdexcept>

#include "repro/core/errors.hpp"
#include "repro/core/rng.hpp"
#include "repro/core/streams.hpp"

using tfw::DeviceCountGuard;
using tfw::draw;

TEST("streams/general_state_roundtrip_replays_draws") {
    repro::general::seed(11);
    auto s = repro::general::get_state();
    const double a = repro::general::random();
    const auto b = repro::general::randint(-5, 5);
    repro::general::set_state(s);
    ASSERT_TRUE(repro::general::random() == a);
    ASSERT_TRUE(repro::general::randint(-5, 5) == b);
}

TEST("streams/numeric_state_roundtrip_replays_draws") {
    repro::numeric::seed(11);
    auto s = repro::numeric::get_state();
    const auto a = repro::numeric::next_u32();
    const double u = repro::numeric::uniform();
    repro::numeric::set_state(s);
    ASSERT_TRUE(repro::numeric::next_u32() == a);
    ASSERT_TRUE(repro::numeric::uniform() == u);
    ASSERT_TRUE(u >= 0.0 && u < 1.0);
}

TEST("streams/same_seed_same_sequence_distinct_seeds_differ") {
    repro::general::seed(-3);
    const double a = repro::general::random();
    repro::general::seed(-3);
    ASSERT_TRUE(repro::general::random() == a);
    repro::general::seed(3);
    ASSERT_TRUE(repro::general::random() != a);

    // upper half of the seed matters too
    repro::numeric::seed(1);
    const auto lo = repro::numeric::next_u32();
    repro::numeric::seed((std::int64_t(1) << 32) | 1);
    ASSERT_TRUE(repro::numeric::next_u32() != lo);
}

TEST("streams/randint_bounds") {
    repro::general::seed(5);
    for (int i = 0; i < 1000; ++i) {
        auto v = repro::general::randint(-2, 3);
        ASSERT_TRUE(v >= -2 && v <= 3);
    }
    ASSERT_TRUE(repro::general::randint(9, 9) == 9);
    // full 64-bit range is accepted
    (void)repro::general::randint(std::numeric_limits<std::int64_t>::min(),
                                  std::numeric_limits<std::int64_t>::max());
    ASSERT_THROWS(repro::general::randint(4, 3), std::invalid_argument);
}

TEST("streams/malformed_state_throws_and_keeps_stream") {
    repro::general::seed(21);
    repro::numeric::seed(21);
    repro::tensor::manual_seed(21);
    const auto g = repro::general::get_state();
    const auto n = repro::numeric::get_state();
    const auto c = repro::tensor::get_rng_state();

    ASSERT_THROWS(repro::general::set_state("not a state"), std::invalid_argument);
    ASSERT_THROWS(repro::general::set_state(g + " 17"), std::invalid_argument);
    ASSERT_THROWS(repro::numeric::set_state(""), std::invalid_argument);
    ASSERT_THROWS(repro::tensor::set_rng_state("12x"), std::invalid_argument);
    ASSERT_THROWS(repro::tensor::set_rng_state("0"), std::invalid_argument);
    ASSERT_THROWS(repro::tensor::set_rng_state("99999999999999999999999"), std::invalid_argument);

    ASSERT_TRUE(repro::general::get_state() == g);
    ASSERT_TRUE(repro::numeric::get_state() == n);
    ASSERT_TRUE(repro::tensor::get_rng_state() == c);
}

TEST("streams/manual_seed_reseeds_cpu_and_every_device") {
    DeviceCountGuard dg(3);
    repro::tensor::manual_seed(77);
    auto first = draw(4);
    repro::tensor::manual_seed(77);
    auto second = draw(4);
    ASSERT_TRUE(first.cpu == second.cpu);
    ASSERT_TRUE(first.devices.size() == 3);
    ASSERT_TRUE(first.devices == second.devices);
}

TEST("streams/device_registry_grow_and_shrink") {
    DeviceCountGuard dg(1);
    ASSERT_TRUE(repro::device::count() == 1);
    repro::tensor::manual_seed(5);
    const auto d0 = repro::tensor::get_device_rng_state(0);

    repro::device::set_count(3);
    ASSERT_TRUE(repro::device::count() == 3);
    // existing device keeps its stream, new ones start at the default seed
    ASSERT_TRUE(repro::tensor::get_device_rng_state(0) == d0);
    ASSERT_TRUE(repro::tensor::get_device_rng_state(2) == std::to_string(repro::kDefaultSeed));

    repro::device::set_count(1);
    ASSERT_TRUE(repro::device::count() == 1);
    ASSERT_TRUE(repro::tensor::get_device_rng_state(0) == d0);
}

TEST("streams/device_out_of_range_is_topology_error") {
    DeviceCountGuard dg(1);
    ASSERT_THROWS(repro::tensor::get_device_rng_state(1), repro::DeviceTopologyMismatchError);
    ASSERT_THROWS(repro::tensor::set_device_rng_state("5", 4), repro::DeviceTopologyMismatchError);
    ASSERT_THROWS(repro::tensor::device_generator(2), repro::DeviceTopologyMismatchError);
    try {
        repro::tensor::set_device_rng_state("5", 4);
    } catch (const repro::DeviceTopologyMismatchError& e) {
        ASSERT_TRUE(e.captured == 5);
        ASSERT_TRUE(e.available == 1);
    }
}

TEST("streams/rng_zero_seed_is_remapped") {
    repro::RNG r;
    r.manual_seed(0);
    ASSERT_TRUE(r.state != 0);
    repro::RNG z(0);
    ASSERT_TRUE(z.state == repro::kDefaultSeed);
    for (int i = 0; i < 100; ++i) {
        double u = r.next_uniform01();
        ASSERT_TRUE(u >= 0.0 && u < 1.0);
    }
}

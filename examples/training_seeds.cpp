// examples/training_seeds.cpp — seeded data / init / model randomness
// - Seeds come from REPRO_DATA_SEED, REPRO_INIT_SEED, REPRO_MODEL_SEED
// - Shuffles a toy dataset per epoch inside data_random
// - Initializes a weight vector inside init_random
// - Draws dropout masks inside model_random
// Running twice with the same seeds prints the same checksums.

#include <cstdint>
#include <cstdio>
#include <exception>
#include <numeric>
#include <utility>
#include <vector>

#include "repro/all.hpp"

// Fisher-Yates over the general-purpose stream.
static void shuffle_indices(std::vector<std::size_t>& idx) {
    for (std::size_t i = idx.size(); i > 1; --i) {
        const auto j = static_cast<std::size_t>(repro::general::randint(0, static_cast<std::int64_t>(i - 1)));
        std::swap(idx[i - 1], idx[j]);
    }
}

static std::vector<double> init_weights(std::size_t n) {
    auto& g = repro::tensor::cpu_generator();
    std::vector<double> w(n);
    for (auto& v : w) v = (g.next_uniform01() * 2.0 - 1.0) * 0.1;
    return w;
}

static std::vector<std::uint8_t> dropout_mask(std::size_t n, double p) {
    auto& g = repro::tensor::cpu_generator();
    std::vector<std::uint8_t> m(n);
    for (auto& b : m) b = g.next_uniform01() >= p ? 1 : 0;
    return m;
}

int main() {
    try {
        const auto cfg = repro::RandomizationConfig::from_env();
        repro::Reproducible rep(cfg);

        const std::size_t N = 16, H = 8, epochs = 3;
        std::vector<double> w = rep.init_random.run([&] { return init_weights(H); });
        const double wsum = std::accumulate(w.begin(), w.end(), 0.0);
        std::printf("init   checksum %.12f\n", wsum);

        std::vector<std::size_t> order(N);
        for (std::size_t e = 0; e < epochs; ++e) {
            std::iota(order.begin(), order.end(), std::size_t{0});
            rep.data_random.run([&] { shuffle_indices(order); });

            std::uint64_t kept = 0;
            for (std::size_t b = 0; b < N; ++b) {
                auto m = rep.model_random.run([&] { return dropout_mask(H, 0.5); });
                for (std::size_t k = 0; k < H; ++k) kept += m[k] * (order[b] + 1) * (k + 1);
            }
            std::printf("epoch %zu first=%zu last=%zu dropout-checksum=%llu\n", e, order.front(),
                        order.back(), static_cast<unsigned long long>(kept));
        }
    } catch (const std::exception& e) {
        std::fprintf(stderr, "training_seeds: %s\n", e.what());
        return 1;
    }
    return 0;
}

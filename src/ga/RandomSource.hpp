#pragma once
#include <algorithm>
#include <cstdint>
#include <numeric>
#include <random>
#include <vector>

/**
 * @brief The single random sequence of an optimization run.
 *
 * Constructed once per run from the seed and passed by reference to every
 * operation that consumes randomness, so a seed reproduces a run exactly.
 */
class RandomSource {
public:
    explicit RandomSource(std::uint64_t seed) : engine(seed) {}

    // Uniform in [0, n)
    size_t uniformIndex(size_t n) {
        std::uniform_int_distribution<size_t> dist(0, n - 1);
        return dist(engine);
    }

    // True with probability p (p <= 0 never, p >= 1 always)
    bool chance(double p) {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(engine) < p;
    }

    /**
     * @brief k distinct indices from [0, n), uniformly, in draw order.
     * Requires k <= n.
     *
     * Small samples (k <= n/2) redraw on collision and never touch an
     * n-sized buffer; larger ones use a partial Fisher-Yates.
     */
    std::vector<size_t> sampleDistinct(size_t n, size_t k) {
        if (2 * k <= n) {
            std::vector<size_t> picked;
            picked.reserve(k);
            while (picked.size() < k) {
                size_t candidate = uniformIndex(n);
                if (std::find(picked.begin(), picked.end(), candidate) == picked.end()) {
                    picked.push_back(candidate);
                }
            }
            return picked;
        }

        std::vector<size_t> pool(n);
        std::iota(pool.begin(), pool.end(), size_t{0});
        for (size_t i = 0; i < k; ++i) {
            size_t j = i + uniformIndex(n - i);
            std::swap(pool[i], pool[j]);
        }
        pool.resize(k);
        return pool;
    }

    template <typename Container>
    void shuffle(Container& c) {
        std::shuffle(c.begin(), c.end(), engine);
    }

private:
    std::mt19937_64 engine;
};

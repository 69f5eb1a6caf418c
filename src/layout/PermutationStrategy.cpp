#include "PermutationStrategy.hpp"
#include <numeric>
#include <stdexcept>

std::vector<size_t> PermutationStrategy::permutablePositions(size_t layoutSize) const {
    if (mode == PermutationMode::RESTRICTED) return indices;

    std::vector<size_t> all(layoutSize);
    std::iota(all.begin(), all.end(), size_t{0});
    return all;
}

void PermutationStrategy::validate(size_t layoutSize) const {
    if (mode == PermutationMode::FULL) {
        if (layoutSize < 2) {
            throw std::invalid_argument("PermutationStrategy: layouts need at least 2 positions to permute");
        }
        return;
    }

    if (indices.size() < 2) {
        throw std::invalid_argument("PermutationStrategy: restricted subset needs at least 2 indices, got " +
                                    std::to_string(indices.size()));
    }

    std::vector<bool> seen(layoutSize, false);
    for (size_t idx : indices) {
        if (idx >= layoutSize) {
            throw std::invalid_argument("PermutationStrategy: index " + std::to_string(idx) +
                                        " is out of range for a layout of " + std::to_string(layoutSize) +
                                        " keys");
        }
        if (seen[idx]) {
            throw std::invalid_argument("PermutationStrategy: duplicate index " + std::to_string(idx));
        }
        seen[idx] = true;
    }
}

#include "GeneticOperators.hpp"
#include <algorithm>
#include <array>
#include <stdexcept>

namespace {

/**
 * @brief One OX child: slice [c1, c2) from `keep`, the rest in `fill` order.
 */
Layout makeChild(const Layout& keep, const Layout& fill, size_t c1, size_t c2) {
    const size_t n = keep.size();
    Layout child(n, '\0');
    std::array<bool, 256> used{};

    for (size_t i = c1; i < c2; ++i) {
        child[i] = keep[i];
        used[static_cast<unsigned char>(keep[i])] = true;
    }

    size_t remaining = n - (c2 - c1);
    size_t fillIdx = c2;
    for (size_t scanned = 0; scanned < n && remaining > 0; ++scanned) {
        char gene = fill[(c2 + scanned) % n];
        unsigned char key = static_cast<unsigned char>(gene);
        if (used[key]) continue;

        child[fillIdx % n] = gene;
        used[key] = true;
        fillIdx++;
        remaining--;
    }

    if (remaining != 0) {
        throw std::logic_error("orderCrossover: parents are not permutations of the same symbols");
    }
    return child;
}

} // namespace

Offspring orderCrossover(const Layout& parentA, const Layout& parentB, size_t c1, size_t c2) {
    const size_t n = parentA.size();
    if (n < 2) return {parentA, parentB};

    if (parentB.size() != n) {
        throw std::invalid_argument("orderCrossover: parents differ in length");
    }
    if (c1 >= c2 || c2 > n) {
        throw std::invalid_argument("orderCrossover: cut points must satisfy c1 < c2 <= size, got (" +
                                    std::to_string(c1) + ", " + std::to_string(c2) + ")");
    }

    return {makeChild(parentA, parentB, c1, c2), makeChild(parentB, parentA, c1, c2)};
}

Offspring orderCrossover(const Layout& parentA, const Layout& parentB, RandomSource& rng) {
    const size_t n = parentA.size();
    if (n < 2) return {parentA, parentB};

    std::vector<size_t> cuts = rng.sampleDistinct(n, 2);
    size_t c1 = std::min(cuts[0], cuts[1]);
    size_t c2 = std::max(cuts[0], cuts[1]);
    return orderCrossover(parentA, parentB, c1, c2);
}

Offspring orderCrossover(const Layout& parentA, const Layout& parentB,
                         const PermutationStrategy& strategy, RandomSource& rng) {
    if (!strategy.isRestricted()) {
        return orderCrossover(parentA, parentB, rng);
    }

    const std::vector<size_t>& indices = strategy.getIndices();
    if (indices.size() < 2) return {parentA, parentB};

    Layout subA, subB;
    subA.reserve(indices.size());
    subB.reserve(indices.size());
    for (size_t idx : indices) {
        subA.push_back(parentA.at(idx));
        subB.push_back(parentB.at(idx));
    }

    Offspring sub = orderCrossover(subA, subB, rng);

    Offspring children{parentA, parentB};
    for (size_t k = 0; k < indices.size(); ++k) {
        children.first[indices[k]] = sub.first[k];
        children.second[indices[k]] = sub.second[k];
    }
    return children;
}

void swapMutation(Layout& layout, double rate, const PermutationStrategy& strategy, RandomSource& rng) {
    if (!rng.chance(rate)) return;

    std::vector<size_t> positions = strategy.permutablePositions(layout.size());
    if (positions.size() < 2) return;

    std::vector<size_t> pick = rng.sampleDistinct(positions.size(), 2);
    std::swap(layout[positions[pick[0]]], layout[positions[pick[1]]]);
}

Layout tournamentSelect(const std::vector<Layout>& population,
                        const std::vector<double>& fitness,
                        size_t k,
                        RandomSource& rng) {
    if (fitness.size() != population.size()) {
        throw std::invalid_argument("tournamentSelect: " + std::to_string(fitness.size()) +
                                    " fitness values for " + std::to_string(population.size()) +
                                    " individuals");
    }
    if (k == 0 || k > population.size()) {
        throw std::invalid_argument("tournamentSelect: tournament size " + std::to_string(k) +
                                    " is invalid for a population of " + std::to_string(population.size()));
    }

    std::vector<size_t> contenders = rng.sampleDistinct(population.size(), k);
    size_t best = contenders[0];
    for (size_t idx : contenders) {
        if (fitness[idx] > fitness[best]) best = idx;
    }
    return population[best];
}

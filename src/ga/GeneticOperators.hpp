#pragma once
#include "KeySpace.hpp"
#include "PermutationStrategy.hpp"
#include "RandomSource.hpp"
#include <utility>
#include <vector>

/**
 * Permutation-preserving genetic operators.
 *
 * Every operator returns or modifies an exclusively owned Layout and keeps it
 * a permutation of its parents' symbols without any repair step. Under a
 * RESTRICTED strategy only the listed positions are ever written.
 */

using Offspring = std::pair<Layout, Layout>;

/**
 * @brief Order Crossover (OX) with explicit cut points.
 *
 * Child A keeps parentA[c1, c2) in place; the remaining slots, starting at c2
 * and wrapping, are filled with parentB's symbols read from index c2
 * (wrapping), skipping symbols already present. Child B is symmetric.
 *
 * @pre parents are permutations of the same symbols, c1 < c2 <= size.
 * Sequences shorter than 2 are returned unchanged.
 */
Offspring orderCrossover(const Layout& parentA, const Layout& parentB, size_t c1, size_t c2);

/**
 * @brief OX with two distinct cut points drawn uniformly from [0, size).
 */
Offspring orderCrossover(const Layout& parentA, const Layout& parentB, RandomSource& rng);

/**
 * @brief OX honouring a permutation strategy.
 *
 * RESTRICTED: OX runs on the subsequence of symbols at the subset positions;
 * every other position is copied from the child's own parent. Subsets with
 * fewer than 2 indices yield copies of the parents.
 */
Offspring orderCrossover(const Layout& parentA, const Layout& parentB,
                         const PermutationStrategy& strategy, RandomSource& rng);

/**
 * @brief With probability rate, swaps two distinct permutable positions.
 *
 * Applied once per individual, not per gene. No-op when fewer than 2
 * positions are permutable.
 */
void swapMutation(Layout& layout, double rate, const PermutationStrategy& strategy, RandomSource& rng);

/**
 * @brief k-way tournament: the fittest of k distinct, uniformly sampled
 * individuals. Returns a copy.
 *
 * @throws std::invalid_argument if k is 0 or exceeds the population size,
 * or if fitness and population sizes differ.
 */
Layout tournamentSelect(const std::vector<Layout>& population,
                        const std::vector<double>& fitness,
                        size_t k,
                        RandomSource& rng);

#pragma once
#include "KeySpace.hpp"
#include "NgramTables.hpp"
#include <map>
#include <string>

enum class CostOrder {
    UNIGRAM,
    BIGRAM,
    TRIGRAM
};

/**
 * @brief Parameters of the cost function.
 *
 * order picks exactly one n-gram granularity so the same keystrokes are never
 * counted at several granularities in one evaluation.
 */
struct CostOptions {
    CostOrder order = CostOrder::BIGRAM;

    // When an n-gram timing is missing, charge the sum of its unigram timings
    // instead. Disabled, a missing n-gram costs nothing.
    bool fallbackToUnigram = false;

    // Must be set for trigram contributions to be counted.
    bool useTrigrams = false;

    /**
     * @throws std::invalid_argument for TRIGRAM order without useTrigrams.
     */
    void validate() const;

    /**
     * @brief "uni", "bi" or "tri".
     * @throws std::invalid_argument for anything else.
     */
    static CostOrder parseOrder(const std::string& name);
    static std::string orderName(CostOrder order);
};

size_t ngramLength(CostOrder order);

/**
 * @brief Total modeled typing time (ms) of the corpus typed on a layout.
 *
 * Each n-gram of the chosen order is mapped logical -> physical through the
 * layout and charged count * timing. N-grams touching an unmapped symbol are
 * skipped. Missing timings fall back to the sum of unigram timings when
 * options.fallbackToUnigram is set and otherwise contribute zero, which
 * underestimates layouts producing many unseen n-grams.
 *
 * Pure function of its arguments; safe to call concurrently.
 */
double computeCost(const Layout& layout,
                   const KeySpace& keySpace,
                   const NgramFrequencies& frequencies,
                   const NgramTimings& timings,
                   const CostOptions& options);

// 1/cost for positive costs, 0 otherwise
double fitnessFromCost(double cost);

using KeyCostMap = std::map<char, double>;

/**
 * @brief Approximate cost share of each physical key, for reporting.
 *
 * Unigram cost goes to its key. Bigram (and, with useTrigrams, trigram) cost
 * is split evenly among the keys it touches, falling back to unigram sums
 * for missing timings. Every key of the space is present in the result.
 */
KeyCostMap perKeyCostApprox(const Layout& layout,
                            const KeySpace& keySpace,
                            const NgramFrequencies& frequencies,
                            const NgramTimings& timings,
                            bool useTrigrams);

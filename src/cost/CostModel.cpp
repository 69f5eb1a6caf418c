#include "CostModel.hpp"
#include "LayoutMapping.hpp"
#include <stdexcept>

namespace {

double unigramTime(const TimingTable& unigrams, char physical) {
    auto it = unigrams.find(std::string(1, physical));
    return it == unigrams.end() ? 0.0 : it->second;
}

/**
 * @brief Maps a logical n-gram to its physical key sequence.
 * @return false if any symbol has no physical key.
 */
bool toPhysical(const LayoutMapping& mapping, const std::string& logical, std::string& physical) {
    physical.resize(logical.size());
    for (size_t i = 0; i < logical.size(); ++i) {
        char p = mapping.physicalFor(logical[i]);
        if (p == '\0') return false;
        physical[i] = p;
    }
    return true;
}

} // namespace

// -------------------------------------------------------------------------
// CostOptions
// -------------------------------------------------------------------------

void CostOptions::validate() const {
    if (order == CostOrder::TRIGRAM && !useTrigrams) {
        throw std::invalid_argument("CostOptions: trigram cost order requires useTrigrams to be enabled");
    }
}

CostOrder CostOptions::parseOrder(const std::string& name) {
    if (name == "uni") return CostOrder::UNIGRAM;
    if (name == "bi") return CostOrder::BIGRAM;
    if (name == "tri") return CostOrder::TRIGRAM;
    throw std::invalid_argument("CostOptions: unknown cost order \"" + name + "\" (expected uni, bi or tri)");
}

std::string CostOptions::orderName(CostOrder order) {
    switch (order) {
        case CostOrder::UNIGRAM: return "uni";
        case CostOrder::BIGRAM: return "bi";
        case CostOrder::TRIGRAM: return "tri";
        default: return "unknown";
    }
}

size_t ngramLength(CostOrder order) {
    switch (order) {
        case CostOrder::UNIGRAM: return 1;
        case CostOrder::BIGRAM: return 2;
        default: return 3;
    }
}

// -------------------------------------------------------------------------
// Cost & fitness
// -------------------------------------------------------------------------

double computeCost(const Layout& layout,
                   const KeySpace& keySpace,
                   const NgramFrequencies& frequencies,
                   const NgramTimings& timings,
                   const CostOptions& options) {
    if (options.order == CostOrder::TRIGRAM && !options.useTrigrams) {
        return 0.0;
    }

    const size_t n = ngramLength(options.order);
    const FrequencyTable& counts = frequencies.forOrder(n);
    const TimingTable& table = timings.forOrder(n);
    const LayoutMapping mapping = LayoutMapping::buildUnchecked(keySpace, layout);

    double cost = 0.0;
    std::string physical;

    for (const auto& entry : counts) {
        const std::string& ngram = entry.first;
        if (ngram.size() != n) continue;
        if (!toPhysical(mapping, ngram, physical)) continue;

        auto it = table.find(physical);
        if (it != table.end()) {
            cost += static_cast<double>(entry.second) * it->second;
        } else if (options.fallbackToUnigram && n > 1) {
            double fallback = 0.0;
            for (char p : physical) fallback += unigramTime(timings.unigrams, p);
            cost += static_cast<double>(entry.second) * fallback;
        }
        // Missing and no fallback: contributes nothing.
    }

    return cost;
}

double fitnessFromCost(double cost) {
    return cost > 0.0 ? 1.0 / cost : 0.0;
}

// -------------------------------------------------------------------------
// Per-key approximation (reporting only)
// -------------------------------------------------------------------------

KeyCostMap perKeyCostApprox(const Layout& layout,
                            const KeySpace& keySpace,
                            const NgramFrequencies& frequencies,
                            const NgramTimings& timings,
                            bool useTrigrams) {
    KeyCostMap keyCost;
    for (char k : keySpace.symbols()) keyCost[k] = 0.0;

    const LayoutMapping mapping = LayoutMapping::buildUnchecked(keySpace, layout);
    std::string physical;

    auto distribute = [&](const FrequencyTable& counts, const TimingTable& table, size_t n) {
        for (const auto& entry : counts) {
            if (entry.first.size() != n) continue;
            if (!toPhysical(mapping, entry.first, physical)) continue;

            double time;
            auto it = table.find(physical);
            if (it != table.end()) {
                time = it->second;
            } else {
                time = 0.0;
                for (char p : physical) time += unigramTime(timings.unigrams, p);
            }

            double share = static_cast<double>(entry.second) * time / static_cast<double>(n);
            for (char p : physical) keyCost[p] += share;
        }
    };

    distribute(frequencies.unigrams, timings.unigrams, 1);
    distribute(frequencies.bigrams, timings.bigrams, 2);
    if (useTrigrams) {
        distribute(frequencies.trigrams, timings.trigrams, 3);
    }

    return keyCost;
}

#pragma once
#include "CostModel.hpp"
#include "FitnessEvaluator.h"
#include "KeySpace.hpp"
#include "NgramTables.hpp"
#include "PopulationEngine.hpp"
#include <memory>
#include <string>
#include <vector>

struct OptimizationResult {
    Layout best;
    double bestCost = 0.0;
    double bestFitness = 0.0;
    std::vector<double> fitnessTrajectory;

    // Cost of the canonical layout under the same cost options
    double baselineCost = 0.0;
    double improvementPercent = 0.0;

    KeyCostMap perKeyCost;
};

/**
 * @brief Runs the GA against the n-gram cost model.
 *
 * Owns the read-only frequency and timing tables for the run and injects
 * fitnessFromCost(computeCost(...)) into the population engine.
 */
class LayoutOptimizer {
private:
    KeySpace keySpace;
    NgramFrequencies frequencies;
    NgramTimings timings;
    CostOptions costOptions;
    std::unique_ptr<PopulationEngine> engine;

public:
    /**
     * @throws std::invalid_argument for inconsistent cost or GA options,
     * before any generation runs.
     */
    LayoutOptimizer(const KeySpace& keySpace,
                    NgramFrequencies frequencies,
                    NgramTimings timings,
                    CostOptions costOptions,
                    GaConfig gaConfig,
                    EvaluatorBackend backend);

    OptimizationResult run();

    double costOf(const Layout& layout) const;

    PopulationEngine& getEngine() { return *engine; }

    std::string getPerformanceReport() const { return engine->getEvaluator().getPerformanceReport(); }
};

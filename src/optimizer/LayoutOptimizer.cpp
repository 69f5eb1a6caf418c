#include "LayoutOptimizer.hpp"
#include <stdexcept>

LayoutOptimizer::LayoutOptimizer(const KeySpace& ks,
                                 NgramFrequencies freq,
                                 NgramTimings times,
                                 CostOptions options,
                                 GaConfig gaConfig,
                                 EvaluatorBackend backend)
    : keySpace(ks), frequencies(std::move(freq)), timings(std::move(times)), costOptions(options) {
    costOptions.validate();

    auto evaluator = createFitnessEvaluator(backend);
    if (!evaluator) {
        throw std::invalid_argument("LayoutOptimizer: unknown evaluator backend");
    }
    engine = std::make_unique<PopulationEngine>(keySpace, std::move(gaConfig), std::move(evaluator));
}

double LayoutOptimizer::costOf(const Layout& layout) const {
    return computeCost(layout, keySpace, frequencies, timings, costOptions);
}

OptimizationResult LayoutOptimizer::run() {
    FitnessFunction fitness = [this](const Layout& layout) {
        return fitnessFromCost(costOf(layout));
    };

    GaResult ga = engine->run(fitness);

    OptimizationResult result;
    result.best = ga.best;
    result.bestFitness = ga.bestFitness;
    result.fitnessTrajectory = std::move(ga.fitnessTrajectory);
    result.bestCost = costOf(result.best);

    result.baselineCost = costOf(keySpace.canonicalLayout());
    if (result.baselineCost > 0.0) {
        result.improvementPercent = 100.0 * (result.baselineCost - result.bestCost) / result.baselineCost;
    }

    result.perKeyCost = perKeyCostApprox(result.best, keySpace, frequencies, timings, costOptions.useTrigrams);
    return result;
}

#pragma once
#include "FitnessEvaluator.h"
#include "GeneticOperators.hpp"
#include "KeySpace.hpp"
#include "PermutationStrategy.hpp"
#include "RandomSource.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Parameters of one evolutionary run.
 */
struct GaConfig {
    size_t populationSize = 200;
    size_t generations = 300;
    double mutationRate = 0.1;
    double crossoverRate = 0.7;
    size_t elitism = 5;
    size_t tournamentSize = 3;
    std::uint64_t seed = 42;
    PermutationStrategy strategy = PermutationStrategy::full();

    // Print progress every logInterval generations; 0 disables it.
    size_t logInterval = 0;

    /**
     * @throws std::invalid_argument describing the first inconsistent value.
     */
    void validate(size_t layoutSize) const;
};

struct GaResult {
    Layout best;
    double bestFitness = 0.0;
    // Best fitness of each evaluated generation, in order
    std::vector<double> fitnessTrajectory;
};

/**
 * @brief Generational GA over layouts with elitism and tournament selection.
 *
 * Each generation: evaluate, copy the elites, record the best fitness,
 * then fill the rest of the next generation with (crossed and mutated)
 * tournament winners. Runs exactly config.generations generations.
 */
class PopulationEngine {
public:
    using GenerationObserver = std::function<void(size_t generation, const std::vector<Layout>& population)>;

    /**
     * The key space is copied.
     * @throws std::invalid_argument if the configuration is inconsistent
     * with the key space; nothing has run at that point.
     */
    PopulationEngine(const KeySpace& keySpace, GaConfig config,
                     std::unique_ptr<IFitnessEvaluator> evaluator);

    /**
     * @brief populationSize shuffles of the canonical layout; under a
     * RESTRICTED strategy only the subset positions are shuffled.
     */
    std::vector<Layout> initPopulation();

    /**
     * @brief Evolves a fresh population from initPopulation().
     */
    GaResult run(const FitnessFunction& fitness);

    /**
     * @brief Evolves the given population.
     * @throws std::invalid_argument if its size differs from populationSize.
     */
    GaResult evolve(std::vector<Layout> population, const FitnessFunction& fitness);

    // Called after every generation with the replacement population.
    void setGenerationObserver(GenerationObserver observer) { observer_ = std::move(observer); }

    const GaConfig& getConfig() const { return config_; }
    const IFitnessEvaluator& getEvaluator() const { return *evaluator_; }

private:
    std::vector<size_t> selectElites(const std::vector<double>& fitness) const;
    std::vector<Layout> nextGeneration(const std::vector<Layout>& population,
                                       const std::vector<double>& fitness);

    KeySpace keySpace_;
    GaConfig config_;
    std::unique_ptr<IFitnessEvaluator> evaluator_;
    RandomSource rng_;
    GenerationObserver observer_;
};

#include "PopulationEngine.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <sstream>
#include <stdexcept>

// -------------------------------------------------------------------------
// GaConfig
// -------------------------------------------------------------------------

void GaConfig::validate(size_t layoutSize) const {
    if (populationSize == 0) {
        throw std::invalid_argument("GaConfig: population size must be at least 1");
    }
    if (tournamentSize == 0 || tournamentSize > populationSize) {
        throw std::invalid_argument("GaConfig: tournament size " + std::to_string(tournamentSize) +
                                    " must be between 1 and the population size " +
                                    std::to_string(populationSize));
    }
    if (elitism > populationSize) {
        throw std::invalid_argument("GaConfig: elitism " + std::to_string(elitism) +
                                    " exceeds the population size " + std::to_string(populationSize));
    }
    if (!(mutationRate >= 0.0 && mutationRate <= 1.0)) {
        throw std::invalid_argument("GaConfig: mutation rate must lie in [0, 1]");
    }
    if (!(crossoverRate >= 0.0 && crossoverRate <= 1.0)) {
        throw std::invalid_argument("GaConfig: crossover rate must lie in [0, 1]");
    }
    strategy.validate(layoutSize);
}

// -------------------------------------------------------------------------
// PopulationEngine
// -------------------------------------------------------------------------

PopulationEngine::PopulationEngine(const KeySpace& keySpace, GaConfig config,
                                   std::unique_ptr<IFitnessEvaluator> evaluator)
    : keySpace_(keySpace), config_(std::move(config)), evaluator_(std::move(evaluator)), rng_(config_.seed) {
    if (!evaluator_) {
        throw std::invalid_argument("PopulationEngine: a fitness evaluator is required");
    }
    config_.validate(keySpace_.size());
}

std::vector<Layout> PopulationEngine::initPopulation() {
    const Layout base = keySpace_.canonicalLayout();
    std::vector<Layout> population;
    population.reserve(config_.populationSize);

    for (size_t i = 0; i < config_.populationSize; ++i) {
        Layout candidate = base;
        if (config_.strategy.isRestricted()) {
            const std::vector<size_t>& indices = config_.strategy.getIndices();
            std::string values;
            for (size_t idx : indices) values.push_back(candidate[idx]);
            rng_.shuffle(values);
            for (size_t k = 0; k < indices.size(); ++k) candidate[indices[k]] = values[k];
        } else {
            rng_.shuffle(candidate);
        }
        population.push_back(std::move(candidate));
    }
    return population;
}

GaResult PopulationEngine::run(const FitnessFunction& fitness) {
    return evolve(initPopulation(), fitness);
}

GaResult PopulationEngine::evolve(std::vector<Layout> population, const FitnessFunction& fitness) {
    if (population.size() != config_.populationSize) {
        throw std::invalid_argument("PopulationEngine: expected a population of " +
                                    std::to_string(config_.populationSize) + " individuals, got " +
                                    std::to_string(population.size()));
    }

    GaResult result;
    result.fitnessTrajectory.reserve(config_.generations);
    std::vector<double> scores;

    for (size_t gen = 0; gen < config_.generations; ++gen) {
        // Phase 1: Evaluate
        evaluator_->evaluate(population, fitness, scores);

        // Phase 2: Record the best of the evaluated generation
        double best = *std::max_element(scores.begin(), scores.end());
        result.fitnessTrajectory.push_back(best);

        if (config_.logInterval > 0 && ((gen + 1) % config_.logInterval == 0 || gen == 0)) {
            std::ostringstream line;
            line << "Generation " << (gen + 1) << "/" << config_.generations
                 << " best fitness " << std::scientific << std::setprecision(6) << best;
            std::cout << line.str() << std::endl;
        }

        // Phase 3: Elitism + reproduction
        population = nextGeneration(population, scores);

        if (observer_) observer_(gen, population);
    }

    evaluator_->evaluate(population, fitness, scores);
    size_t bestIdx = static_cast<size_t>(std::max_element(scores.begin(), scores.end()) - scores.begin());
    result.best = population[bestIdx];
    result.bestFitness = scores[bestIdx];
    return result;
}

std::vector<size_t> PopulationEngine::selectElites(const std::vector<double>& fitness) const {
    std::vector<size_t> order(fitness.size());
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(),
                     [&fitness](size_t a, size_t b) { return fitness[a] > fitness[b]; });
    order.resize(std::min(config_.elitism, order.size()));
    return order;
}

std::vector<Layout> PopulationEngine::nextGeneration(const std::vector<Layout>& population,
                                                     const std::vector<double>& fitness) {
    std::vector<Layout> next;
    next.reserve(config_.populationSize);

    // Elites are copied; the current population stays untouched.
    for (size_t idx : selectElites(fitness)) {
        next.push_back(population[idx]);
    }

    while (next.size() < config_.populationSize) {
        Layout p1 = tournamentSelect(population, fitness, config_.tournamentSize, rng_);
        Layout p2 = tournamentSelect(population, fitness, config_.tournamentSize, rng_);

        Offspring children;
        if (rng_.chance(config_.crossoverRate)) {
            children = orderCrossover(p1, p2, config_.strategy, rng_);
        } else {
            children = Offspring(std::move(p1), std::move(p2));
        }

        swapMutation(children.first, config_.mutationRate, config_.strategy, rng_);
        swapMutation(children.second, config_.mutationRate, config_.strategy, rng_);

        next.push_back(std::move(children.first));
        if (next.size() < config_.populationSize) {
            next.push_back(std::move(children.second));
        }
    }

    return next;
}

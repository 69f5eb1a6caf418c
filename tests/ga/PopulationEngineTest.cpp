#include <mpi.h>
#include <gtest/gtest.h>
#include "FitnessEvaluator.h"
#include "KeySpace.hpp"
#include "PermutationStrategy.hpp"
#include "PopulationEngine.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <stdexcept>

// ============================================================================
// Helpers
// ============================================================================

// Rewards keys placed at their position in the reversed canonical layout
static double matchesReversed(const Layout& layout) {
    const Layout& base = KeySpace::standard().symbols();
    double score = 0.0;
    for (size_t i = 0; i < layout.size(); ++i) {
        if (layout[i] == base[base.size() - 1 - i]) score += 1.0;
    }
    return score + 1.0;
}

static GaConfig smallConfig() {
    GaConfig config;
    config.populationSize = 30;
    config.generations = 40;
    config.mutationRate = 0.2;
    config.crossoverRate = 0.8;
    config.elitism = 2;
    config.tournamentSize = 3;
    config.seed = 7;
    return config;
}

class PopulationEngineTest : public ::testing::TestWithParam<EvaluatorBackend> {
protected:
    const KeySpace& ks = KeySpace::standard();

    std::unique_ptr<PopulationEngine> makeEngine(const GaConfig& config) {
        return std::make_unique<PopulationEngine>(ks, config, createFitnessEvaluator(GetParam()));
    }
};

// ============================================================================
// Evolution invariants
// ============================================================================

TEST_P(PopulationEngineTest, ElitismKeepsBestFitnessMonotone) {
    auto engine = makeEngine(smallConfig());
    GaResult result = engine->run(matchesReversed);

    ASSERT_EQ(result.fitnessTrajectory.size(), 40u);
    for (size_t g = 1; g < result.fitnessTrajectory.size(); ++g) {
        EXPECT_GE(result.fitnessTrajectory[g], result.fitnessTrajectory[g - 1]) << "generation " << g;
    }
    EXPECT_GE(result.bestFitness, result.fitnessTrajectory.back());
    EXPECT_GT(result.fitnessTrajectory.back(), result.fitnessTrajectory.front());
}

TEST_P(PopulationEngineTest, EveryGenerationIsAFullSetOfPermutations) {
    auto engine = makeEngine(smallConfig());
    const Layout base = ks.canonicalLayout();
    size_t observed = 0;

    engine->setGenerationObserver([&](size_t generation, const std::vector<Layout>& population) {
        EXPECT_EQ(generation, observed);
        ASSERT_EQ(population.size(), 30u);
        for (const Layout& layout : population) {
            ASSERT_TRUE(isPermutationOf(layout, base));
        }
        observed++;
    });

    GaResult result = engine->run(matchesReversed);

    EXPECT_EQ(observed, 40u);
    EXPECT_TRUE(isPermutationOf(result.best, base));
    EXPECT_DOUBLE_EQ(result.bestFitness, matchesReversed(result.best));
}

TEST_P(PopulationEngineTest, FullStrategyInitialPopulationIsPermutations) {
    auto engine = makeEngine(smallConfig());
    const Layout base = ks.canonicalLayout();

    std::vector<Layout> population = engine->initPopulation();
    ASSERT_EQ(population.size(), 30u);
    size_t shuffled = 0;
    for (const Layout& layout : population) {
        EXPECT_TRUE(isPermutationOf(layout, base));
        if (layout != base) shuffled++;
    }
    EXPECT_GT(shuffled, 0u);
}

TEST_P(PopulationEngineTest, RestrictedStrategyFreezesOtherKeys) {
    GaConfig config = smallConfig();
    config.strategy = PermutationStrategy::restricted(ks.indicesFor(KeyGroup::LETTERS));
    auto engine = makeEngine(config);

    const Layout base = ks.canonicalLayout();
    std::vector<size_t> frozen = ks.indicesFor(KeyGroup::DIGITS);
    for (size_t i : ks.indicesFor(KeyGroup::SYMBOLS)) frozen.push_back(i);

    for (const Layout& layout : engine->initPopulation()) {
        for (size_t i : frozen) ASSERT_EQ(layout[i], base[i]);
    }

    engine->setGenerationObserver([&](size_t, const std::vector<Layout>& population) {
        for (const Layout& layout : population) {
            for (size_t i : frozen) ASSERT_EQ(layout[i], base[i]);
        }
    });

    GaResult result = engine->run(matchesReversed);
    for (size_t i : frozen) EXPECT_EQ(result.best[i], base[i]);
}

TEST_P(PopulationEngineTest, SameSeedReproducesRun) {
    GaResult first = makeEngine(smallConfig())->run(matchesReversed);
    GaResult second = makeEngine(smallConfig())->run(matchesReversed);

    EXPECT_EQ(first.best, second.best);
    EXPECT_EQ(first.fitnessTrajectory, second.fitnessTrajectory);
}

TEST_P(PopulationEngineTest, ZeroGenerationsReturnsBestOfInitialPopulation) {
    GaConfig config = smallConfig();
    config.generations = 0;
    auto engine = makeEngine(config);

    std::vector<Layout> population(30, ks.canonicalLayout());
    population[17] = ks.symbols();
    std::reverse(population[17].begin(), population[17].end());

    GaResult result = engine->evolve(population, matchesReversed);

    EXPECT_TRUE(result.fitnessTrajectory.empty());
    EXPECT_EQ(result.best, population[17]);
    EXPECT_DOUBLE_EQ(result.bestFitness, 47.0);
}

TEST_P(PopulationEngineTest, EvolveRejectsWrongPopulationSize) {
    auto engine = makeEngine(smallConfig());
    std::vector<Layout> population(29, ks.canonicalLayout());

    EXPECT_THROW(engine->evolve(population, matchesReversed), std::invalid_argument);
}

INSTANTIATE_TEST_SUITE_P(
    Backends,
    PopulationEngineTest,
    ::testing::Values(
        EvaluatorBackend::SEQUENTIAL,
        EvaluatorBackend::OPENMP,
        EvaluatorBackend::MPI
    ),
    [](const ::testing::TestParamInfo<EvaluatorBackend>& info) {
        switch (info.param) {
            case EvaluatorBackend::SEQUENTIAL: return "Sequential";
            case EvaluatorBackend::OPENMP: return "OpenMP";
            case EvaluatorBackend::MPI: return "MPI";
            default: return "Unknown";
        }
    }
);

// ============================================================================
// Configuration
// ============================================================================

TEST(GaConfigTest, InconsistentValuesFailBeforeRunning) {
    const KeySpace& ks = KeySpace::standard();
    auto expectRejected = [&ks](GaConfig config) {
        EXPECT_THROW(PopulationEngine(ks, config, makeSequentialEvaluator()), std::invalid_argument);
    };

    GaConfig config = smallConfig();
    config.populationSize = 0;
    expectRejected(config);

    config = smallConfig();
    config.tournamentSize = 31;
    expectRejected(config);

    config = smallConfig();
    config.tournamentSize = 0;
    expectRejected(config);

    config = smallConfig();
    config.elitism = 31;
    expectRejected(config);

    config = smallConfig();
    config.mutationRate = 1.5;
    expectRejected(config);

    config = smallConfig();
    config.crossoverRate = -0.1;
    expectRejected(config);

    config = smallConfig();
    config.strategy = PermutationStrategy::restricted({4});
    expectRejected(config);

    EXPECT_THROW(PopulationEngine(ks, smallConfig(), nullptr), std::invalid_argument);
    EXPECT_NO_THROW(PopulationEngine(ks, smallConfig(), makeSequentialEvaluator()));
}

TEST(GaConfigTest, ElitismMayFillThePopulation) {
    GaConfig config = smallConfig();
    config.elitism = config.populationSize;
    PopulationEngine engine(KeySpace::standard(), config, makeSequentialEvaluator());

    std::vector<Layout> initial = engine.initPopulation();
    std::vector<Layout> last;
    engine.setGenerationObserver([&last](size_t, const std::vector<Layout>& population) { last = population; });
    engine.evolve(initial, matchesReversed);

    // Nothing but elites: the population is only reordered
    std::sort(initial.begin(), initial.end());
    std::sort(last.begin(), last.end());
    EXPECT_EQ(initial, last);
}

TEST(PopulationEngineLoggingTest, PrintsProgressAtInterval) {
    GaConfig config = smallConfig();
    config.generations = 10;
    config.logInterval = 5;
    PopulationEngine engine(KeySpace::standard(), config, makeSequentialEvaluator());

    ::testing::internal::CaptureStdout();
    engine.run(matchesReversed);
    std::string output = ::testing::internal::GetCapturedStdout();

    EXPECT_NE(output.find("Generation 1/10"), std::string::npos);
    EXPECT_NE(output.find("Generation 5/10"), std::string::npos);
    EXPECT_NE(output.find("Generation 10/10"), std::string::npos);
    EXPECT_EQ(output.find("Generation 3/10"), std::string::npos);
}

TEST(PopulationEngineLoggingTest, LeavesStreamFormattingUntouched) {
    GaConfig config = smallConfig();
    config.generations = 3;
    config.logInterval = 1;
    PopulationEngine engine(KeySpace::standard(), config, makeSequentialEvaluator());

    const std::ios_base::fmtflags flags = std::cout.flags();
    const std::streamsize precision = std::cout.precision();

    ::testing::internal::CaptureStdout();
    engine.run(matchesReversed);
    std::cout << 0.125 << std::endl;
    std::string output = ::testing::internal::GetCapturedStdout();

    EXPECT_EQ(std::cout.flags(), flags);
    EXPECT_EQ(std::cout.precision(), precision);
    EXPECT_NE(output.find("\n0.125\n"), std::string::npos);
}

// ============================================================================
// Key space ownership
// ============================================================================

static double firstKeyIsF(const Layout& layout) {
    return layout[0] == 'f' ? 2.0 : 1.0;
}

TEST(PopulationEngineKeySpaceTest, OutlivesCustomKeySpace) {
    GaConfig config = smallConfig();
    config.populationSize = 10;
    config.generations = 5;

    std::unique_ptr<PopulationEngine> engine;
    {
        KeySpace local("abcdef", {3, 3});
        engine = std::make_unique<PopulationEngine>(local, config, makeSequentialEvaluator());
    }

    GaResult result = engine->run(firstKeyIsF);
    EXPECT_TRUE(isPermutationOf(result.best, "abcdef"));
    for (const Layout& layout : engine->initPopulation()) {
        EXPECT_TRUE(isPermutationOf(layout, "abcdef"));
    }
}

TEST(PopulationEngineKeySpaceTest, AcceptsTemporaryKeySpace) {
    GaConfig config = smallConfig();
    config.populationSize = 10;
    config.generations = 5;
    PopulationEngine engine(KeySpace("abcdef", {6}), config, makeSequentialEvaluator());

    GaResult result = engine.run(firstKeyIsF);
    EXPECT_TRUE(isPermutationOf(result.best, "abcdef"));
    EXPECT_EQ(result.fitnessTrajectory.size(), 5u);
}

int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);

    ::testing::InitGoogleTest(&argc, argv);

    // Only rank 0 prints results
    ::testing::TestEventListeners& listeners = ::testing::UnitTest::GetInstance()->listeners();
    int world_rank;
    MPI_Comm_rank(MPI_COMM_WORLD, &world_rank);
    if (world_rank != 0) {
        delete listeners.Release(listeners.default_result_printer());
    }

    int result = RUN_ALL_TESTS();

    MPI_Finalize();

    return result;
}

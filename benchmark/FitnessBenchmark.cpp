#include "../src/cost/CorpusCounter.hpp"
#include "../src/cost/CostModel.hpp"
#include "../src/cost/TimingData.hpp"
#include "../src/ga/FitnessEvaluator.h"
#include "../src/ga/PopulationEngine.hpp"
#include "../src/layout/KeySpace.hpp"
#include <benchmark/benchmark.h>
#include <mpi.h>
#include <cstring>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

// ============================================================================
// 1. Shared Workload
// ============================================================================

namespace BenchUtils {

    struct TestConfig {
        std::string name;
        size_t populationSize;
        size_t generations;   // 0 = evaluation only
        int iterations;       // fixed so every rank runs the same collectives
    };

    const char* kCorpus =
        "the quick brown fox jumps over the lazy dog while five boxing wizards jump quickly. "
        "sphinx of black quartz, judge my vow; pack my box with five dozen liquor jugs! "
        "keyboard layouts trade finger travel against row changes and repeated keys.";

    // Tables are built once and shared read-only by every benchmark
    struct Workload {
        NgramFrequencies frequencies;
        NgramTimings timings;
        CostOptions options;
    };

    const Workload& GetWorkload() {
        static const Workload workload = [] {
            const KeySpace& ks = KeySpace::standard();
            Workload w;
            std::istringstream corpus(kCorpus);
            w.frequencies = countNgrams(corpus, ks.symbols());
            w.timings = aggregateTimingRecords(generateSyntheticRecords(ks, SyntheticTimingModel(), 1234)).timings;
            w.options.order = CostOrder::BIGRAM;
            w.options.fallbackToUnigram = true;
            return w;
        }();
        return workload;
    }

    FitnessFunction MakeFitness() {
        const Workload* w = &GetWorkload();
        return [w](const Layout& layout) {
            return fitnessFromCost(computeCost(layout, KeySpace::standard(), w->frequencies, w->timings, w->options));
        };
    }

    std::vector<Layout> GeneratePopulation(size_t size, unsigned seed) {
        RandomSource rng(seed);
        std::vector<Layout> population(size, KeySpace::standard().canonicalLayout());
        for (auto& layout : population) rng.shuffle(layout);
        return population;
    }

    // Helper to parse metrics
    double ExtractMetric(const std::string& report, const std::string& key) {
        size_t pos = report.find(key);
        if (pos == std::string::npos) return 0.0;
        size_t numStart = report.find_first_of("0123456789.", pos);
        if (numStart == std::string::npos) return 0.0;
        return std::stod(report.substr(numStart));
    }
}

// ============================================================================
// 2. Benchmark Fixture
// ============================================================================

class FitnessFixture {
protected:
    int rank;
    int world_size;

public:
    void SetUp(const ::benchmark::State&) {
        MPI_Comm_rank(MPI_COMM_WORLD, &rank);
        MPI_Comm_size(MPI_COMM_WORLD, &world_size);
    }

    void RunTest(benchmark::State& state, EvaluatorBackend backend, BenchUtils::TestConfig config) {
        FitnessFunction fitness = BenchUtils::MakeFitness();

        for (auto _ : state) {
            state.PauseTiming();

            auto population = BenchUtils::GeneratePopulation(config.populationSize, 42 + state.iterations());
            auto evaluator = createFitnessEvaluator(backend);
            std::string report;

            MPI_Barrier(MPI_COMM_WORLD);

            if (config.generations == 0) {
                std::vector<double> scores;

                state.ResumeTiming();
                evaluator->evaluate(population, fitness, scores);
                state.PauseTiming();

                if (scores.size() != population.size()) {
                    state.SkipWithError("Evaluator returned the wrong number of scores");
                }
                report = evaluator->getPerformanceReport();
            } else {
                GaConfig gaConfig;
                gaConfig.populationSize = config.populationSize;
                gaConfig.generations = config.generations;
                gaConfig.seed = 42;
                PopulationEngine engine(KeySpace::standard(), gaConfig, std::move(evaluator));

                state.ResumeTiming();
                GaResult result = engine.run(fitness);
                state.PauseTiming();

                benchmark::DoNotOptimize(result.bestFitness);
                report = engine.getEvaluator().getPerformanceReport();
            }

            double commTime = BenchUtils::ExtractMetric(report, "Comm Time");
            if (rank == 0 && commTime > 0.0) {
                state.counters["Comm_ms"] = benchmark::Counter(commTime, benchmark::Counter::kAvgIterations);
            }

            state.ResumeTiming();
        }

        if (rank == 0) {
            state.counters["Pop"] = config.populationSize;
            state.counters["Procs"] = world_size;
        }
    }
};

// ============================================================================
// 3. Registration
// ============================================================================

void RegisterBackend(const std::string& name, EvaluatorBackend backend,
                     const std::vector<BenchUtils::TestConfig>& configs) {
    for (const auto& cfg : configs) {
        std::string testName = name + "/" + cfg.name + "/" + std::to_string(cfg.populationSize);

        auto* b = benchmark::RegisterBenchmark(testName.c_str(),
            [backend, cfg](benchmark::State& st) {
                FitnessFixture fixture;
                fixture.SetUp(st);
                fixture.RunTest(st, backend, cfg);
            });

        b->Unit(benchmark::kMillisecond);
        b->Iterations(cfg.iterations);
    }
}

namespace Suites {
    using BenchUtils::TestConfig;

    const std::vector<TestConfig> Evaluate = {
        {"Eval", 200, 0, 20},
        {"Eval", 2000, 0, 5},
    };

    const std::vector<TestConfig> Evolve = {
        {"Evolve", 200, 20, 1},
    };
}

// ============================================================================
// 4. Main
// ============================================================================

int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);
    int rank;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);

    RegisterBackend("Sequential", EvaluatorBackend::SEQUENTIAL, Suites::Evaluate);
    RegisterBackend("Sequential", EvaluatorBackend::SEQUENTIAL, Suites::Evolve);

    RegisterBackend("OpenMP", EvaluatorBackend::OPENMP, Suites::Evaluate);
    RegisterBackend("OpenMP", EvaluatorBackend::OPENMP, Suites::Evolve);

    RegisterBackend("MPI", EvaluatorBackend::MPI, Suites::Evaluate);
    RegisterBackend("MPI", EvaluatorBackend::MPI, Suites::Evolve);

    if (rank == 0) {
        std::cout << "Layout GA Benchmark Suite Initialized." << std::endl;
        std::cout << "Usage: ./layoutga_bench --benchmark_filter=<Regex>" << std::endl;
        std::cout << "Examples:" << std::endl;
        std::cout << "  mpirun -np 4 ./layoutga_bench --benchmark_filter=\"MPI\"" << std::endl;
        std::cout << "  ./layoutga_bench --benchmark_filter=\"Evolve\"" << std::endl;
    }

    if (rank == 0) {
        ::benchmark::Initialize(&argc, argv);
        ::benchmark::RunSpecifiedBenchmarks();
    } else {
        // Non-root ranks keep the filter (so they join the same collectives)
        // but drop output file arguments.
        std::vector<char*> args = {argv[0]};
        for (int i = 1; i < argc; ++i) {
            if (std::strncmp(argv[i], "--benchmark_filter", 18) == 0) args.push_back(argv[i]);
        }
        int argc_minimal = static_cast<int>(args.size());
        ::benchmark::Initialize(&argc_minimal, args.data());

        class NullReporter : public ::benchmark::BenchmarkReporter {
            bool ReportContext(const Context&) override { return true; }
            void ReportRuns(const std::vector<Run>&) override {}
            void Finalize() override {}
        };
        NullReporter null_reporter;
        ::benchmark::RunSpecifiedBenchmarks(&null_reporter);
    }

    ::benchmark::Shutdown();
    MPI_Finalize();
    return 0;
}

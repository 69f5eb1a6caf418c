#include "AsciiReport.hpp"
#include "CorpusCounter.hpp"
#include "CostModel.hpp"
#include "KeySpace.hpp"
#include "LayoutOptimizer.hpp"
#include "TimingData.hpp"
#include <chrono>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <mpi.h>

using namespace std;
using namespace std::chrono;

// Used when no corpus file is given on the command line
static const char* kSampleCorpus =
    "the quick brown fox jumps over the lazy dog. pack my box with five dozen liquor jugs.\n"
    "how vexingly quick daft zebras jump! sphinx of black quartz, judge my vow.\n"
    "the five boxing wizards jump quickly; 1234567890 - [brackets] = 'quotes' / slash\\.\n"
    "genetic algorithms search permutations of keys to shorten the time spent typing text.\n";

static const char* kLayoutFile = "best_layout.txt";

static NgramFrequencies loadFrequencies(int argc, char** argv, const KeySpace& keySpace) {
    if (argc > 1) {
        return countNgramsInFile(argv[1], keySpace.symbols());
    }
    istringstream sample(kSampleCorpus);
    return countNgrams(sample, keySpace.symbols());
}

static int runDemo(int argc, char** argv, int rank, int size) {
    const KeySpace& keySpace = KeySpace::standard();

    // Run parameters (adjust as needed)
    GaConfig gaConfig;
    gaConfig.populationSize = 200;
    gaConfig.generations = 300;
    gaConfig.mutationRate = 0.1;
    gaConfig.crossoverRate = 0.7;
    gaConfig.elitism = 5;
    gaConfig.seed = 42;
    gaConfig.logInterval = (rank == 0) ? 50 : 0;

    CostOptions costOptions;
    costOptions.order = CostOrder::BIGRAM;
    costOptions.fallbackToUnigram = true;
    costOptions.useTrigrams = false;

    EvaluatorBackend backend = (size > 1) ? EvaluatorBackend::MPI : EvaluatorBackend::OPENMP;

    if (rank == 0) {
        cout << "=======================================================\n";
        cout << "GA Keyboard Layout Optimizer\n";
        cout << "=======================================================\n";
        cout << "Keys: " << keySpace.size() << "\n";
        cout << "Population: " << gaConfig.populationSize << ", Generations: " << gaConfig.generations << "\n";
        cout << "Cost order: " << CostOptions::orderName(costOptions.order)
             << ", fallback to unigrams: " << (costOptions.fallbackToUnigram ? "yes" : "no") << "\n";
        cout << "Evaluator: " << getEvaluatorBackendName(backend) << ", MPI Processes: " << size << "\n";
        cout << "=======================================================\n\n";
        cout << "Loading typing data (synthetic)...\n";
    }

    TimingAggregation timing = aggregateTimingRecords(
        generateSyntheticRecords(keySpace, SyntheticTimingModel(), 1234));

    if (rank == 0) {
        cout << "Timings: uni=" << timing.timings.unigrams.size() << " bi=" << timing.timings.bigrams.size()
             << " tri=" << timing.timings.trigrams.size();
        if (timing.skippedRecords > 0) cout << " (skipped " << timing.skippedRecords << " records)";
        cout << "\nCounting corpus n-grams...\n";
    }

    NgramFrequencies frequencies = loadFrequencies(argc, argv, keySpace);

    if (rank == 0) {
        cout << "Frequencies: uni=" << frequencies.unigrams.size() << " bi=" << frequencies.bigrams.size()
             << " tri=" << frequencies.trigrams.size() << "\n";
        cout << "Evolving...\n";
    }

    LayoutOptimizer optimizer(keySpace, std::move(frequencies), std::move(timing.timings),
                              costOptions, gaConfig, backend);

    auto start = high_resolution_clock::now();
    OptimizationResult result = optimizer.run();
    auto end = high_resolution_clock::now();
    auto duration = duration_cast<milliseconds>(end - start);

    if (rank == 0) {
        cout << "\nBest layout (string):\n" << layoutString(result.best) << "\n";
        cout << "\nBest layout (ASCII):\n" << formatLayoutAscii(keySpace, result.best) << "\n";
        cout << fixed << setprecision(2);
        cout << "\nBest cost: " << result.bestCost << " ms, fitness: "
             << scientific << setprecision(6) << result.bestFitness << "\n";
        cout << fixed << setprecision(2);
        cout << "Baseline (QWERTY) cost: " << result.baselineCost << " ms\n";
        cout << "Improvement over QWERTY: " << result.improvementPercent << "%\n";
        cout << "\nFitness (ASCII sparkline):\n" << sparkline(result.fitnessTrajectory) << "\n";
        cout << "\nPer-key cost (approx):\n" << formatKeyCostGrid(keySpace, result.perKeyCost) << "\n";
        writeLayoutFile(kLayoutFile, keySpace, result.best);
        cout << "\nBest layout written to " << kLayoutFile << "\n";
        cout << "\nExecution time: " << duration.count() << " ms\n";
        cout << optimizer.getPerformanceReport();
    }
    return 0;
}

int main(int argc, char** argv) {
    // Initialize MPI
    MPI_Init(&argc, &argv);

    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    int status = 0;
    try {
        status = runDemo(argc, argv, rank, size);
    } catch (const exception& e) {
        cerr << "[rank " << rank << "] error: " << e.what() << endl;
        status = 1;
    }

    MPI_Finalize();
    return status;
}

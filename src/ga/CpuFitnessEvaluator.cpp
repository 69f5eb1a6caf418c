#include "FitnessEvaluator.h"
#include <chrono>
#include <omp.h>
#include <sstream>

class SequentialFitnessEvaluator : public IFitnessEvaluator {
private:
    double total_compute_time_ms = 0.0;
    size_t evaluations = 0;

public:
    void evaluate(const std::vector<Layout>& population, const FitnessFunction& fitness,
                  std::vector<double>& fitnessOut) override {
        auto start = std::chrono::high_resolution_clock::now();

        fitnessOut.resize(population.size());
        for (size_t i = 0; i < population.size(); ++i) {
            fitnessOut[i] = fitness(population[i]);
        }

        auto end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double, std::milli> elapsed = end - start;
        total_compute_time_ms += elapsed.count();
        evaluations += population.size();
    }

    std::string getBackendName() const override { return "CPU (Sequential)"; }

    std::string getPerformanceReport() const override {
        std::ostringstream report;
        report << "=== Sequential Evaluator Performance Report ===\n";
        report << "Individuals Evaluated: " << evaluations << "\n";
        report << "Compute Time: " << total_compute_time_ms << " ms\n";
        return report.str();
    }
};

/**
 * @brief Evaluates individuals on OpenMP worker threads.
 *
 * The fitness function only reads shared tables and each thread writes
 * its own slots, so no synchronization is needed beyond the implicit
 * barrier at the end of the parallel loop.
 */
class OpenMpFitnessEvaluator : public IFitnessEvaluator {
private:
    double total_compute_time_ms = 0.0;
    size_t evaluations = 0;

public:
    void evaluate(const std::vector<Layout>& population, const FitnessFunction& fitness,
                  std::vector<double>& fitnessOut) override {
        auto start = std::chrono::high_resolution_clock::now();

        fitnessOut.resize(population.size());
        const long long count = static_cast<long long>(population.size());

        #pragma omp parallel for schedule(dynamic)
        for (long long i = 0; i < count; ++i) {
            fitnessOut[i] = fitness(population[i]);
        }

        auto end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double, std::milli> elapsed = end - start;
        total_compute_time_ms += elapsed.count();
        evaluations += population.size();
    }

    std::string getBackendName() const override { return "CPU (OpenMP)"; }

    std::string getPerformanceReport() const override {
        std::ostringstream report;
        report << "=== OpenMP Evaluator Performance Report ===\n";
        report << "Threads: " << omp_get_max_threads() << "\n";
        report << "Individuals Evaluated: " << evaluations << "\n";
        report << "Compute Time: " << total_compute_time_ms << " ms\n";
        return report.str();
    }
};

// Builder Implementation
std::unique_ptr<IFitnessEvaluator> makeSequentialEvaluator() {
    return std::make_unique<SequentialFitnessEvaluator>();
}

std::unique_ptr<IFitnessEvaluator> makeOpenMpEvaluator() {
    return std::make_unique<OpenMpFitnessEvaluator>();
}

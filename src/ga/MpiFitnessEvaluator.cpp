#include "FitnessEvaluator.h"
#include <algorithm>
#include <chrono>
#include <mpi.h>
#include <sstream>
#include <stdexcept>

/**
 * @brief Distributes a generation's evaluation over MPI_COMM_WORLD.
 *
 * Every rank runs the same seeded search and holds the same population.
 * The population is split into contiguous blocks (rank r scores indices
 * [r*chunk, (r+1)*chunk)), and the partial results are exchanged with
 * MPI_Allgatherv so every rank continues with the full fitness vector.
 */
class MpiFitnessEvaluator : public IFitnessEvaluator {
private:
    int rank = 0;
    int world_size = 1;

    std::vector<double> local_fitness;
    std::vector<int> recv_counts;
    std::vector<int> displacements;

    double total_compute_time_ms = 0.0;
    double total_comm_time_ms = 0.0;
    size_t evaluations = 0;

public:
    MpiFitnessEvaluator() {
        int initialized = 0;
        MPI_Initialized(&initialized);
        if (!initialized) {
            throw std::runtime_error("MPI must be initialized before creating the MPI fitness evaluator");
        }
        MPI_Comm_rank(MPI_COMM_WORLD, &rank);
        MPI_Comm_size(MPI_COMM_WORLD, &world_size);
        recv_counts.resize(world_size);
        displacements.resize(world_size);
    }

    void evaluate(const std::vector<Layout>& population, const FitnessFunction& fitness,
                  std::vector<double>& fitnessOut) override {
        const int n = static_cast<int>(population.size());
        const int chunk = (n + world_size - 1) / world_size;

        for (int r = 0; r < world_size; ++r) {
            int begin = std::min(n, r * chunk);
            int end = std::min(n, begin + chunk);
            displacements[r] = begin;
            recv_counts[r] = end - begin;
        }

        // 1. Score the local block
        auto computeStart = std::chrono::high_resolution_clock::now();

        const int localBegin = displacements[rank];
        const int localCount = recv_counts[rank];
        local_fitness.resize(localCount);
        for (int i = 0; i < localCount; ++i) {
            local_fitness[i] = fitness(population[localBegin + i]);
        }

        auto computeEnd = std::chrono::high_resolution_clock::now();

        // 2. Exchange blocks
        fitnessOut.resize(population.size());
        MPI_Allgatherv(local_fitness.data(), localCount, MPI_DOUBLE,
                       fitnessOut.data(), recv_counts.data(), displacements.data(), MPI_DOUBLE,
                       MPI_COMM_WORLD);

        auto commEnd = std::chrono::high_resolution_clock::now();

        std::chrono::duration<double, std::milli> compute = computeEnd - computeStart;
        std::chrono::duration<double, std::milli> comm = commEnd - computeEnd;
        total_compute_time_ms += compute.count();
        total_comm_time_ms += comm.count();
        evaluations += localCount;
    }

    std::string getBackendName() const override { return "MPI (" + std::to_string(world_size) + " ranks)"; }

    std::string getPerformanceReport() const override {
        std::ostringstream report;
        report << "=== MPI Evaluator Performance Report ===\n";
        report << "Rank: " << rank << " of " << world_size << "\n";
        report << "Individuals Evaluated (local): " << evaluations << "\n";
        report << "Compute Time: " << total_compute_time_ms << " ms\n";
        report << "Comm Time: " << total_comm_time_ms << " ms\n";
        return report.str();
    }
};

std::unique_ptr<IFitnessEvaluator> makeMpiEvaluator() {
    return std::make_unique<MpiFitnessEvaluator>();
}

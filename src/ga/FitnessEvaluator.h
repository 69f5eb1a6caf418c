#ifndef FITNESS_EVALUATOR_H
#define FITNESS_EVALUATOR_H

#include "KeySpace.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Must be safe to call concurrently: backends evaluate individuals in parallel.
using FitnessFunction = std::function<double(const Layout&)>;

// Enumeration for available backends
enum class EvaluatorBackend { SEQUENTIAL, OPENMP, MPI };

// Abstract Interface
class IFitnessEvaluator {
public:
  virtual ~IFitnessEvaluator() = default;

  /**
   * @brief Scores every individual of a generation.
   *
   * fitnessOut is resized to population.size(); slot i receives the fitness
   * of population[i]. Returns only after every slot is written (on every
   * rank for the MPI backend).
   */
  virtual void evaluate(const std::vector<Layout> &population,
                        const FitnessFunction &fitness,
                        std::vector<double> &fitnessOut) = 0;

  virtual std::string getBackendName() const = 0;

  /**
   * @brief Evaluation counters (individuals scored, compute and
   * communication time).
   */
  virtual std::string getPerformanceReport() const = 0;
};

// =========================================================================
// Backend Builders
// Implemented in CpuFitnessEvaluator.cpp and MpiFitnessEvaluator.cpp.
// =========================================================================

std::unique_ptr<IFitnessEvaluator> makeSequentialEvaluator();

std::unique_ptr<IFitnessEvaluator> makeOpenMpEvaluator();

std::unique_ptr<IFitnessEvaluator> makeMpiEvaluator();

// Main Factory
inline std::unique_ptr<IFitnessEvaluator>
createFitnessEvaluator(EvaluatorBackend type) {
  switch (type) {
  case EvaluatorBackend::SEQUENTIAL:
    return makeSequentialEvaluator();
  case EvaluatorBackend::OPENMP:
    return makeOpenMpEvaluator();
  case EvaluatorBackend::MPI:
    return makeMpiEvaluator();
  default:
    return nullptr;
  }
}

inline std::string getEvaluatorBackendName(EvaluatorBackend type) {
  switch (type) {
  case EvaluatorBackend::SEQUENTIAL:
    return "Sequential";
  case EvaluatorBackend::OPENMP:
    return "OpenMP";
  case EvaluatorBackend::MPI:
    return "MPI";
  default:
    return "Unknown";
  }
}

#endif // FITNESS_EVALUATOR_H

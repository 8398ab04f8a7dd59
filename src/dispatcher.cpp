///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "dispatcher.hpp"
#include "../sequential/sequential_executor.hpp"
#include "../threads/threaded_executor.hpp"
#include "../processes/process_executor.hpp"
#include "../processes/future_executor.hpp"
#include <stdexcept>


///////////////////////////
///     DISPATCHER      ///
///////////////////////////
std::unique_ptr<ParallelExecutor> ParallelDispatcher::makeExecutor(Strategy strategy, int workers,
                                                                   const DispatchOptions& options) {
    switch (strategy) {
        case Strategy::ISOLATED_PROCESS:
            return std::make_unique<ProcessExecutor>(workers);
        case Strategy::SHARED_MEMORY_THREAD:
            return std::make_unique<ThreadedExecutor>(workers, options.serializeThreadKernel);
        case Strategy::MANAGED_FUTURE:
            return std::make_unique<FutureExecutor>(workers);
    }
    throw std::invalid_argument("Unknown strategy");
}

ExecutionResult ParallelDispatcher::run(const Matrix& a, const Matrix& b, int workers, Strategy strategy,
                                        const DispatchOptions& options) {
    if (!MatrixSource::compatible(a, b)) {
        throw ShapeMismatch(a.shape(), b.shape());
    }
    return makeExecutor(strategy, workers, options)->multiply(a, b);
}

/**
 * @brief Run the baseline, then each worker count under each strategy.
 *
 * Worker counts are visited in the order given and, for each of them, the
 * strategies in the order given, so the strategies see comparable system
 * state at every parallel degree.
 */
MethodComparison ParallelDispatcher::compareMethods(const Matrix& a, const Matrix& b,
                                                    const std::vector<int>& workerCounts,
                                                    const std::vector<Strategy>& strategies,
                                                    const DispatchOptions& options) {
    SequentialExecutor baseline;
    ExecutionResult seq = baseline.multiply(a, b);

    MethodComparison comparison;
    comparison.sequentialTime = seq.elapsed;

    for (int workers : workerCounts) {
        for (Strategy strategy : strategies) {
            ExecutionResult par = run(a, b, workers, strategy, options);
            comparison.parallelTimes[strategy][workers] = par.elapsed;
            if (par.result != seq.result) {
                comparison.resultsMatch = false;
            }
        }
    }
    return comparison;
}

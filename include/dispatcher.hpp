#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "matrix.hpp"
#include "executor_base.hpp"
#include <map>
#include <memory>
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Knobs that do not change the result of a dispatch.
 */
struct DispatchOptions {
    /// Serialize kernel calls of the shared-memory-thread strategy.
    bool serializeThreadKernel = false;
};

/**
 * @brief Timings of every strategy and worker count against one baseline.
 */
struct MethodComparison {
    /// Seconds taken by the sequential baseline.
    double sequentialTime = 0.0;

    /// parallelTimes[strategy][workers] = seconds.
    std::map<Strategy, std::map<int, double>> parallelTimes;

    /// True iff every parallel product equalled the baseline product exactly.
    bool resultsMatch = true;
};


///////////////////////////
///     DISPATCHER      ///
///////////////////////////
/**
 * @brief Entry point for running a multiplication under a chosen strategy.
 *
 * Stateless: each call builds its own executor, which owns its workers for
 * the duration of the call only. Concurrent calls are not supported.
 */
class ParallelDispatcher {
public:
    /**
     * @brief Build the executor implementing a strategy.
     *
     * @throws InvalidWorkerCount if workers <= 0.
     */
    static std::unique_ptr<ParallelExecutor> makeExecutor(Strategy strategy, int workers,
                                                          const DispatchOptions& options = {});

    /**
     * @brief Multiply a by b with workers parallel workers.
     *
     * The product equals SequentialExecutor's exactly for every strategy and
     * worker count. The elapsed time covers pool construction, dispatch,
     * collection and teardown.
     *
     * @throws ShapeMismatch, InvalidWorkerCount, DispatchFailure.
     */
    static ExecutionResult run(const Matrix& a, const Matrix& b, int workers, Strategy strategy,
                               const DispatchOptions& options = {});

    /**
     * @brief Time the baseline once, then every strategy at every worker count.
     *
     * Each parallel product is checked against the baseline product after its
     * timer has stopped.
     *
     * @throws ShapeMismatch, InvalidWorkerCount, DispatchFailure.
     */
    static MethodComparison compareMethods(const Matrix& a, const Matrix& b,
                                           const std::vector<int>& workerCounts,
                                           const std::vector<Strategy>& strategies,
                                           const DispatchOptions& options = {});
};

#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "matrix.hpp"
#include "partitioner.hpp"
#include "executor_base.hpp"
#include <vector>


///////////////////////////
///      EXECUTORS      ///
///////////////////////////
/**
 * @brief Managed-future strategy: forked workers collected through futures.
 *
 * Workers are the same isolated processes as in ProcessExecutor. Each one is
 * wrapped in a std::future obtained from std::async, which drains its pipe
 * and reaps it concurrently with the others; results are taken from the
 * futures in submission order, regardless of which worker finishes first.
 */
class FutureExecutor : public ParallelExecutor {
public:
    /**
     * @param numWorkers Number of worker processes (one per chunk).
     * @throws InvalidWorkerCount if numWorkers <= 0.
     */
    explicit FutureExecutor(int numWorkers);

protected:
    std::vector<Matrix> dispatch(const std::vector<Chunk>& chunks, const Matrix& right) override;
};

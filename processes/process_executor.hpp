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
 * @brief Isolated-process strategy: one forked worker process per chunk.
 *
 * Each worker owns a private copy of the operands, computes its chunk and
 * sends the partial product back through a pipe. The parent forks every
 * worker first, then drains and reaps them in chunk order. Process start-up
 * and the copy back are part of the measured time.
 */
class ProcessExecutor : public ParallelExecutor {
public:
    /**
     * @param numProcesses Number of worker processes (one per chunk).
     * @throws InvalidWorkerCount if numProcesses <= 0.
     */
    explicit ProcessExecutor(int numProcesses);

protected:
    std::vector<Matrix> dispatch(const std::vector<Chunk>& chunks, const Matrix& right) override;
};

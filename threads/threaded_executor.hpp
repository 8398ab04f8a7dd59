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
 * @brief Shared-memory strategy: one std::thread per chunk.
 *
 * Every thread reads the left operand slice and the right operand in place
 * and writes its partial product into its own slot of a vector indexed by
 * chunk position, so no synchronization is needed beyond the final join.
 *
 * The C++ runtime has no process-wide execution lock, so this strategy
 * scales with the available cores. With serializeKernel enabled, a lock
 * owned by the dispatch call is held around each kernel invocation, which
 * reproduces the behaviour of a runtime that serializes threads: the
 * workers still exist and are scheduled, but compute one at a time.
 */
class ThreadedExecutor : public ParallelExecutor {
public:
    /**
     * @brief Create a threaded executor.
     *
     * @param numThreads      Number of worker threads (one per chunk).
     * @param serializeKernel Hold a per-call lock around each kernel call.
     * @throws InvalidWorkerCount if numThreads <= 0.
     */
    explicit ThreadedExecutor(int numThreads, bool serializeKernel = false);

    bool serializesKernel() const { return serializeKernel_; }

protected:
    std::vector<Matrix> dispatch(const std::vector<Chunk>& chunks, const Matrix& right) override;

private:
    bool serializeKernel_;
};

#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "matrix.hpp"
#include "partitioner.hpp"
#include <string>
#include <vector>

///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Worker isolation model used to run chunks concurrently.
 */
enum class Strategy {
    ISOLATED_PROCESS,     ///< One forked process per chunk, results piped back.
    SHARED_MEMORY_THREAD, ///< One thread per chunk, operands shared by reference.
    MANAGED_FUTURE        ///< Forked processes collected through std::future.
};

/// All strategies, in the order they are reported.
static const Strategy kAllStrategies[] = {
        Strategy::ISOLATED_PROCESS,
        Strategy::SHARED_MEMORY_THREAD,
        Strategy::MANAGED_FUTURE
};

/**
 * @brief Stable name of a strategy ("isolated-process", ...).
 */
std::string strategyName(Strategy s);

/**
 * @brief Parse a strategy name or its short alias (process, thread, future).
 *
 * @throws std::invalid_argument for an unknown name.
 */
Strategy parseStrategy(const std::string& name);

/**
 * @brief Product of a multiplication together with its measured duration.
 */
struct ExecutionResult {
    /// The product matrix.
    Matrix result;

    /// Seconds spent in the timed region (monotonic clock, never negative).
    double elapsed;
};


///////////////////////////
///      INTERFACE      ///
///////////////////////////
/**
 * @brief Common interface for matrix multiplication executors.
 *
 * Implementations may be sequential, multithreaded or multi-process, but all
 * expose the same multiply() contract and return exactly the same product.
 */
class IExecutor {
public:
    virtual ~IExecutor() = default;

    /**
     * @brief Multiply a by b and time the computation.
     *
     * @throws ShapeMismatch if a.cols != b.rows.
     */
    virtual ExecutionResult multiply(const Matrix& a, const Matrix& b) = 0;
};

/**
 * @brief Shared algorithm of every parallel strategy.
 *
 * multiply() validates the operands, starts the clock, partitions the left
 * operand into one chunk per worker, hands the chunks to dispatch(), stacks
 * the partial products in chunk order and stops the clock. Pool construction
 * and teardown happen inside dispatch() and are therefore timed.
 * Subclasses only decide how the chunks are run. Anything other than a
 * MatmulError escaping dispatch() (std::bad_alloc, a foreign exception type)
 * is reported as a DispatchFailure.
 */
class ParallelExecutor : public IExecutor {
public:
    /**
     * @throws InvalidWorkerCount if workers <= 0.
     */
    ParallelExecutor(Strategy strategy, int workers);

    ExecutionResult multiply(const Matrix& a, const Matrix& b) override;

    Strategy strategy() const { return strategy_; }
    int workers() const { return workers_; }

protected:
    /**
     * @brief Run every chunk against the full right operand.
     *
     * @return Partial products indexed by chunk position.
     * @throws DispatchFailure if a worker cannot be started or fails.
     */
    virtual std::vector<Matrix> dispatch(const std::vector<Chunk>& chunks, const Matrix& right) = 0;

    /**
     * @brief Work done by one worker: the product of its chunk with right.
     *
     * Called from inside the worker (thread or child process).
     */
    virtual Matrix computeChunk(const Chunk& chunk, const Matrix& right) const;

    /// Build a DispatchFailure tagged with this executor's strategy and size.
    DispatchFailure failure(const std::string& cause) const;

private:
    Strategy strategy_;
    int workers_;
};

/**
 * @brief Stack partial products vertically, in the order given.
 *
 * @param partials Partial products, all with the same column count.
 * @param cols     Column count of the result (used when partials are empty).
 */
Matrix stackRows(const std::vector<Matrix>& partials, int cols);

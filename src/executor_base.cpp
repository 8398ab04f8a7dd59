///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "executor_base.hpp"
#include "kernel.hpp"
#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>


///////////////////////////
///     STRATEGIES      ///
///////////////////////////
std::string strategyName(Strategy s) {
    switch (s) {
        case Strategy::ISOLATED_PROCESS:     return "isolated-process";
        case Strategy::SHARED_MEMORY_THREAD: return "shared-memory-thread";
        case Strategy::MANAGED_FUTURE:       return "managed-future";
    }
    return "unknown";
}

Strategy parseStrategy(const std::string& name) {
    if (name == "isolated-process" || name == "process") return Strategy::ISOLATED_PROCESS;
    if (name == "shared-memory-thread" || name == "thread") return Strategy::SHARED_MEMORY_THREAD;
    if (name == "managed-future" || name == "future") return Strategy::MANAGED_FUTURE;
    throw std::invalid_argument("Unknown strategy: " + name);
}


///////////////////////////
///      EXECUTORS      ///
///////////////////////////
ParallelExecutor::ParallelExecutor(Strategy strategy, int workers)
        : strategy_(strategy),
          workers_(workers) {
    if (workers <= 0) {
        throw InvalidWorkerCount(workers);
    }
}

/**
 * @brief Validate, partition, dispatch and reassemble under one timer.
 */
ExecutionResult ParallelExecutor::multiply(const Matrix& a, const Matrix& b) {
    if (!MatrixSource::compatible(a, b)) {
        throw ShapeMismatch(a.shape(), b.shape());
    }

    auto start = std::chrono::steady_clock::now();

    std::vector<Chunk> chunks = Partitioner::split(a, workers_);
    std::vector<Matrix> partials;
    try {
        partials = dispatch(chunks, b);
    } catch (const MatmulError&) {
        throw;
    } catch (const std::exception& e) {
        throw failure(e.what());
    } catch (...) {
        throw failure("unknown error");
    }
    if (partials.size() != chunks.size()) {
        throw failure("expected " + std::to_string(chunks.size()) + " partial results, got " +
                      std::to_string(partials.size()));
    }
    Matrix result = stackRows(partials, b.cols);

    auto end = std::chrono::steady_clock::now();
    double elapsed = std::chrono::duration<double>(end - start).count();

    return {std::move(result), elapsed};
}

Matrix ParallelExecutor::computeChunk(const Chunk& chunk, const Matrix& right) const {
    return multiplyChunk(chunk, right);
}

DispatchFailure ParallelExecutor::failure(const std::string& cause) const {
    return DispatchFailure(strategyName(strategy_), workers_, cause);
}

Matrix stackRows(const std::vector<Matrix>& partials, int cols) {
    int rows = 0;
    for (const Matrix& m : partials) {
        rows += m.rows;
    }

    Matrix result(rows, cols);
    auto out = result.data.begin();
    for (const Matrix& m : partials) {
        out = std::copy(m.data.begin(), m.data.end(), out);
    }
    return result;
}

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "future_executor.hpp"
#include "child_process.hpp"
#include <future>
#include <exception>
#include <string>


///////////////////////////
///      EXECUTORS      ///
///////////////////////////
FutureExecutor::FutureExecutor(int numWorkers)
        : ParallelExecutor(Strategy::MANAGED_FUTURE, numWorkers) {}

/**
 * @brief Fork every worker, then hand each one to an async collector.
 *
 * All forks happen on the calling thread before any collector thread
 * exists. Futures returned by std::async block in their destructor, so every
 * collector has finished by the time this function returns or throws.
 */
std::vector<Matrix> FutureExecutor::dispatch(const std::vector<Chunk>& chunks, const Matrix& right) {
    std::vector<ChildProcess> children;
    children.reserve(chunks.size());

    try {
        for (const Chunk& chunk : chunks) {
            children.push_back(ChildProcess::spawn([this, &chunk, &right]() {
                return computeChunk(chunk, right);
            }));
        }
    } catch (const std::exception& e) {
        throw failure(std::string("could not start worker process: ") + e.what());
    }

    std::vector<std::future<Matrix>> futures;
    futures.reserve(chunks.size());

    try {
        for (const Chunk& chunk : chunks) {
            int rows = chunk.rowCount;
            int cols = right.cols;
            futures.push_back(std::async(std::launch::async,
                                         [child = std::move(children[chunk.index]), rows, cols]() mutable {
                                             return child.collect(rows, cols);
                                         }));
        }
    } catch (const std::exception& e) {
        throw failure(std::string("could not start collector: ") + e.what());
    }

    // Submission order, not completion order.
    std::vector<Matrix> partials(chunks.size());
    for (std::size_t i = 0; i < futures.size(); ++i) {
        try {
            partials[i] = futures[i].get();
        } catch (const std::exception& e) {
            throw failure(e.what());
        }
    }
    return partials;
}

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "process_executor.hpp"
#include "child_process.hpp"
#include <exception>


///////////////////////////
///      EXECUTORS      ///
///////////////////////////
ProcessExecutor::ProcessExecutor(int numProcesses)
        : ParallelExecutor(Strategy::ISOLATED_PROCESS, numProcesses) {}

/**
 * @brief Fork all workers, then collect their results in chunk order.
 *
 * If any fork fails, the workers already started are killed and reaped by
 * their handles as the vector unwinds.
 */
std::vector<Matrix> ProcessExecutor::dispatch(const std::vector<Chunk>& chunks, const Matrix& right) {
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

    std::vector<Matrix> partials(chunks.size());
    for (const Chunk& chunk : chunks) {
        try {
            partials[chunk.index] = children[chunk.index].collect(chunk.rowCount, right.cols);
        } catch (const std::exception& e) {
            throw failure(e.what());
        }
    }
    return partials;
}

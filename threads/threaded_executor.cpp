///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "threaded_executor.hpp"
#include <exception>
#include <mutex>
#include <thread>


///////////////////////////
///      EXECUTORS      ///
///////////////////////////
ThreadedExecutor::ThreadedExecutor(int numThreads, bool serializeKernel)
        : ParallelExecutor(Strategy::SHARED_MEMORY_THREAD, numThreads),
          serializeKernel_(serializeKernel) {}

/**
 * @brief Start one thread per chunk, join them all, then surface failures.
 *
 * Threads are always joined before this function returns or throws. A
 * failure to start a thread, or an exception inside any worker, aborts the
 * dispatch with a DispatchFailure.
 */
std::vector<Matrix> ThreadedExecutor::dispatch(const std::vector<Chunk>& chunks, const Matrix& right) {
    std::vector<Matrix> partials(chunks.size());
    std::vector<std::exception_ptr> errors(chunks.size());

    // Lives for this call only; shared by this call's workers.
    std::mutex kernelMutex;

    auto work = [&](const Chunk& chunk) {
        try {
            if (serializeKernel_) {
                std::lock_guard<std::mutex> lock(kernelMutex);
                partials[chunk.index] = computeChunk(chunk, right);
            } else {
                partials[chunk.index] = computeChunk(chunk, right);
            }
        } catch (...) {
            errors[chunk.index] = std::current_exception();
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(chunks.size());

    try {
        for (const Chunk& chunk : chunks) {
            threads.emplace_back(work, chunk);
        }
    } catch (const std::exception& e) {
        for (auto& t : threads) t.join();
        throw failure(std::string("could not start worker thread: ") + e.what());
    }

    // Join barrier: no other synchronization is needed during computation.
    for (auto& t : threads) {
        t.join();
    }

    for (std::size_t i = 0; i < errors.size(); ++i) {
        if (!errors[i]) continue;
        try {
            std::rethrow_exception(errors[i]);
        } catch (const std::exception& e) {
            throw failure("worker " + std::to_string(i) + " failed: " + e.what());
        } catch (...) {
            throw failure("worker " + std::to_string(i) + " failed");
        }
    }
    return partials;
}

#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "matrix.hpp"
#include <functional>
#include <sys/types.h>


///////////////////////////
///       WORKERS       ///
///////////////////////////
/**
 * @brief A forked worker process that computes one matrix and pipes it back.
 *
 * spawn() forks the calling process. The child runs the task on its own
 * copy-on-write copy of the inputs, writes the result to a pipe as a
 * (rows, cols) int32 header followed by the row-major int32 payload, and
 * exits. The parent keeps the read end and the child's pid.
 *
 * The handle owns the child: a child that was never collected is killed and
 * reaped when its handle is destroyed, so no worker outlives its dispatch.
 */
class ChildProcess {
public:
    using Task = std::function<Matrix()>;

    /**
     * @brief Fork a child that runs task and sends back its result.
     *
     * @throws std::system_error if the pipe or the process cannot be created.
     */
    static ChildProcess spawn(const Task& task);

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    ~ChildProcess();

    /**
     * @brief Read the child's result and reap it.
     *
     * Blocks until the whole payload is read and the child has exited.
     *
     * @param expectedRows Row count the result must have.
     * @param expectedCols Column count the result must have.
     * @throws std::runtime_error on a short read, an unexpected shape, or a
     *         child that did not exit successfully.
     */
    Matrix collect(int expectedRows, int expectedCols);

    pid_t pid() const { return pid_; }

private:
    ChildProcess(pid_t pid, int readFd) : pid_(pid), readFd_(readFd) {}

    /// Kill and reap a still-running child, close the pipe.
    void release() noexcept;

    /// Wait for the child and return its raw wait status.
    int reap();

    pid_t pid_ = -1; ///< Child pid, or -1 once reaped.
    int readFd_ = -1; ///< Read end of the result pipe, or -1 once closed.
};

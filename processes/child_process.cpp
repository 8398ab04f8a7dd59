///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "child_process.hpp"
#include <cerrno>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <sys/wait.h>
#include <unistd.h>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/// Exit code of a child whose task threw.
static constexpr int kTaskFailed = 2;

/// Exit code of a child that could not write its result.
static constexpr int kWriteFailed = 3;

/**
 * @brief Write exactly n bytes, retrying on partial writes and EINTR.
 */
static bool writeFully(int fd, const void* buf, std::size_t n) {
    const char* p = static_cast<const char*>(buf);
    while (n > 0) {
        ssize_t w = ::write(fd, p, n);
        if (w < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += w;
        n -= (std::size_t)w;
    }
    return true;
}

/**
 * @brief Read exactly n bytes; false on error or premature end of file.
 */
static bool readFully(int fd, void* buf, std::size_t n) {
    char* p = static_cast<char*>(buf);
    while (n > 0) {
        ssize_t r = ::read(fd, p, n);
        if (r < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (r == 0) return false;
        p += r;
        n -= (std::size_t)r;
    }
    return true;
}

static bool writeMatrix(int fd, const Matrix& m) {
    std::int32_t header[2] = {m.rows, m.cols};
    if (!writeFully(fd, header, sizeof(header))) return false;
    return writeFully(fd, m.data.data(), m.bytes());
}

/**
 * @brief Human-readable description of a wait status.
 */
static std::string describeStatus(int status) {
    std::stringstream ss;
    if (WIFEXITED(status)) {
        ss << "exited with status " << WEXITSTATUS(status);
        if (WEXITSTATUS(status) == kTaskFailed) ss << " (task failed)";
        if (WEXITSTATUS(status) == kWriteFailed) ss << " (could not write result)";
    } else if (WIFSIGNALED(status)) {
        ss << "terminated by signal " << WTERMSIG(status);
    } else {
        ss << "ended with wait status " << status;
    }
    return ss.str();
}


///////////////////////////
///       WORKERS       ///
///////////////////////////
ChildProcess ChildProcess::spawn(const Task& task) {
    int fds[2];
    if (::pipe(fds) != 0) {
        throw std::system_error(errno, std::generic_category(), "pipe");
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        throw std::system_error(err, std::generic_category(), "fork");
    }

    if (pid == 0) {
        // Child: compute, send, and leave without unwinding the parent's state.
        ::close(fds[0]);
        int status = EXIT_SUCCESS;
        try {
            Matrix result = task();
            if (!writeMatrix(fds[1], result)) status = kWriteFailed;
        } catch (const std::exception&) {
            status = kTaskFailed;
        }
        ::close(fds[1]);
        ::_exit(status);
    }

    ::close(fds[1]);
    return ChildProcess(pid, fds[0]);
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
        : pid_(other.pid_),
          readFd_(other.readFd_) {
    other.pid_ = -1;
    other.readFd_ = -1;
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        release();
        pid_ = other.pid_;
        readFd_ = other.readFd_;
        other.pid_ = -1;
        other.readFd_ = -1;
    }
    return *this;
}

ChildProcess::~ChildProcess() {
    release();
}

/**
 * @brief Read header and payload, then reap the child.
 *
 * The pipe is closed before waiting so that a child still blocked on a
 * write (after a shape mismatch) gets EPIPE and terminates.
 */
Matrix ChildProcess::collect(int expectedRows, int expectedCols) {
    if (pid_ < 0 || readFd_ < 0) {
        throw std::runtime_error("worker process already collected");
    }

    std::string problem;
    Matrix result;

    std::int32_t header[2] = {0, 0};
    if (!readFully(readFd_, header, sizeof(header))) {
        problem = "no result received";
    } else if (header[0] != expectedRows || header[1] != expectedCols) {
        std::stringstream ss;
        ss << "unexpected result shape " << toString({header[0], header[1]})
           << ", expected " << toString({expectedRows, expectedCols});
        problem = ss.str();
    } else {
        result = Matrix(expectedRows, expectedCols);
        if (!readFully(readFd_, result.data.data(), result.bytes())) {
            problem = "truncated result";
        }
    }

    ::close(readFd_);
    readFd_ = -1;

    pid_t pid = pid_;
    int status = reap();

    bool exitedCleanly = WIFEXITED(status) && WEXITSTATUS(status) == EXIT_SUCCESS;
    if (!problem.empty() || !exitedCleanly) {
        std::stringstream ss;
        ss << "worker process " << pid << " " << describeStatus(status);
        if (!problem.empty()) ss << ": " << problem;
        throw std::runtime_error(ss.str());
    }
    return result;
}

int ChildProcess::reap() {
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0) {
        if (errno != EINTR) {
            int err = errno;
            pid_ = -1;
            throw std::system_error(err, std::generic_category(), "waitpid");
        }
    }
    pid_ = -1;
    return status;
}

void ChildProcess::release() noexcept {
    if (readFd_ >= 0) {
        ::close(readFd_);
        readFd_ = -1;
    }
    if (pid_ > 0) {
        ::kill(pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
        pid_ = -1;
    }
}

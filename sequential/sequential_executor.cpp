///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "sequential_executor.hpp"
#include "kernel.hpp"
#include <chrono>


///////////////////////////
///      EXECUTORS      ///
///////////////////////////
ExecutionResult SequentialExecutor::multiply(const Matrix& a, const Matrix& b) {
    if (!MatrixSource::compatible(a, b)) {
        throw ShapeMismatch(a.shape(), b.shape());
    }

    auto start = std::chrono::steady_clock::now();
    Matrix result = multiplyMatrices(a, b);
    auto end = std::chrono::steady_clock::now();

    return {std::move(result), std::chrono::duration<double>(end - start).count()};
}

#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "matrix.hpp"
#include "executor_base.hpp"


///////////////////////////
///      EXECUTORS      ///
///////////////////////////
/**
 * @brief Single-threaded multiplication used as the timing baseline.
 *
 * Runs the kernel once over the whole left operand. Every speedup is
 * measured relative to the time reported here for the same operands.
 */
class SequentialExecutor : public IExecutor {
public:
    /**
     * @brief Multiply a by b with a single kernel call.
     *
     * The timed region wraps only the kernel call; shape validation happens
     * before the clock starts.
     *
     * @throws ShapeMismatch if a.cols != b.rows.
     */
    ExecutionResult multiply(const Matrix& a, const Matrix& b) override;
};

#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "matrix.hpp"
#include "executor_base.hpp"
#include <optional>
#include <vector>


///////////////////////////
///      EXECUTORS      ///
///////////////////////////
/**
 * @brief Row-partitioned multiplication across the ranks of MPI_COMM_WORLD.
 *
 * Every rank is an isolated worker process: rank 0 broadcasts the right
 * operand, scatters one row chunk of the left operand to each rank (chunk i
 * goes to rank i, sized by Partitioner::rowCounts), every rank runs the
 * kernel on its chunk, and rank 0 gathers the partial products in rank
 * order. The world size plays the role of the worker count.
 */
class MpiRowExecutor {
public:
    /**
     * @brief Multiply a by b cooperatively across all ranks.
     *
     * Must be called on every rank. Only the operands passed on rank 0 are
     * used; other ranks may pass empty matrices.
     *
     * The elapsed time (MPI_Wtime) starts after a barrier and covers the
     * broadcast, scatter, local kernel and gather.
     *
     * @return The product and its duration on rank 0, std::nullopt elsewhere.
     * @throws ShapeMismatch on every rank if rank 0's operands are incompatible.
     */
    std::optional<ExecutionResult> multiply(const Matrix& a, const Matrix& b);

private:
    /**
     * @brief Element counts and offsets of each rank's slice.
     *
     * @param rows       Rows of the partitioned matrix.
     * @param cols       Columns per row.
     * @param worldSize  Number of ranks.
     * @param counts     Output element count per rank.
     * @param displs     Output element offset per rank.
     */
    static void sliceLayout(int rows, int cols, int worldSize,
                            std::vector<int>& counts, std::vector<int>& displs);
};

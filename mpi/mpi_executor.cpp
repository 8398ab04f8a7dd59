///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "mpi_executor.hpp"
#include "kernel.hpp"
#include "partitioner.hpp"
#include <mpi.h>
#include <utility>


///////////////////////////
///      EXECUTORS      ///
///////////////////////////
void MpiRowExecutor::sliceLayout(int rows, int cols, int worldSize,
                                 std::vector<int>& counts, std::vector<int>& displs) {
    std::vector<int> rowCounts = Partitioner::rowCounts(rows, worldSize);
    counts.assign(worldSize, 0);
    displs.assign(worldSize, 0);

    int offset = 0;
    for (int r = 0; r < worldSize; ++r) {
        counts[r] = rowCounts[r] * cols;
        displs[r] = offset;
        offset += counts[r];
    }
}

std::optional<ExecutionResult> MpiRowExecutor::multiply(const Matrix& a, const Matrix& b) {
    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    // Shapes travel first so every rank can validate and allocate.
    int dims[4] = {0, 0, 0, 0};
    if (rank == 0) {
        dims[0] = a.rows;
        dims[1] = a.cols;
        dims[2] = b.rows;
        dims[3] = b.cols;
    }
    MPI_Bcast(dims, 4, MPI_INT, 0, MPI_COMM_WORLD);

    Shape left{dims[0], dims[1]};
    Shape right{dims[2], dims[3]};
    if (left.cols != right.rows) {
        throw ShapeMismatch(left, right);
    }

    MPI_Barrier(MPI_COMM_WORLD);
    double start = MPI_Wtime();

    // Right operand, replicated on every rank.
    Matrix localRight(right.rows, right.cols);
    if (rank == 0) {
        localRight.data = b.data;
    }
    MPI_Bcast(localRight.data.data(), (int)localRight.size(), MPI_INT32_T, 0, MPI_COMM_WORLD);

    // Row chunk of the left operand.
    std::vector<int> sendCounts, sendDispls;
    sliceLayout(left.rows, left.cols, size, sendCounts, sendDispls);
    int localRows = left.cols > 0 ? sendCounts[rank] / left.cols
                                  : Partitioner::rowCounts(left.rows, size)[rank];

    std::vector<Element> localLeft((std::size_t)sendCounts[rank]);
    MPI_Scatterv(rank == 0 ? a.data.data() : nullptr, sendCounts.data(), sendDispls.data(), MPI_INT32_T,
                 localLeft.data(), sendCounts[rank], MPI_INT32_T,
                 0, MPI_COMM_WORLD);

    Matrix partial = multiplyRows(localLeft.data(), localRows, localRight);

    // Partial products come back in rank order, which is partition order.
    std::vector<int> recvCounts, recvDispls;
    sliceLayout(left.rows, right.cols, size, recvCounts, recvDispls);

    Matrix result;
    if (rank == 0) {
        result = Matrix(left.rows, right.cols);
    }
    MPI_Gatherv(partial.data.data(), (int)partial.size(), MPI_INT32_T,
                rank == 0 ? result.data.data() : nullptr, recvCounts.data(), recvDispls.data(), MPI_INT32_T,
                0, MPI_COMM_WORLD);

    double elapsed = MPI_Wtime() - start;

    if (rank != 0) {
        return std::nullopt;
    }
    return ExecutionResult{std::move(result), elapsed < 0.0 ? 0.0 : elapsed};
}

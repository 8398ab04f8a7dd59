#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "matrix.hpp"
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Contiguous row slice of the left operand assigned to one worker.
 *
 * A chunk is a view: it refers to the left operand without copying it and
 * is paired with the full right operand when it is dispatched. Chunks with
 * rowCount == 0 occur when there are more workers than rows.
 */
struct Chunk {
    int index; ///< Position in partition order (0..n-1).
    int firstRow; ///< First row of the left operand covered by the chunk.
    int rowCount; ///< Number of rows covered (may be zero).
    const Matrix* source; ///< Left operand the chunk slices (non-owning).

    /// Pointer to the first element of the slice inside source->data.
    const Element* data() const { return source->rowData(firstRow); }

    /// Number of columns of the slice (the left operand's column count).
    int cols() const { return source->cols; }

    bool empty() const { return rowCount == 0; }
};


///////////////////////////
///     PARTITIONER     ///
///////////////////////////
/**
 * @brief Splits a left operand into row-contiguous chunks, one per worker.
 *
 * With R rows and n workers, every chunk gets R / n rows and the first
 * R % n chunks get one extra row, so chunk sizes differ by at most one and
 * concatenating the chunks in order yields the original rows.
 */
class Partitioner {
public:
    /**
     * @brief Row count of each of the n chunks of a rows-row matrix.
     *
     * @throws InvalidWorkerCount if n <= 0.
     */
    static std::vector<int> rowCounts(int rows, int n);

    /**
     * @brief Partition a into exactly n ordered chunks.
     *
     * @throws InvalidWorkerCount if n <= 0.
     */
    static std::vector<Chunk> split(const Matrix& a, int n);

    /**
     * @brief Copy the rows of a chunk into a standalone matrix.
     */
    static Matrix slice(const Chunk& chunk);
};

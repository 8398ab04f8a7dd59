#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "errors.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>


///////////////////////////
///       MODELS        ///
///////////////////////////
/// Element type of every matrix handled by the engine.
using Element = std::int32_t;

/// Generated entries are drawn from [0, kMaxGeneratedValue).
static constexpr Element kMaxGeneratedValue = 100;

/// Default practical upper bound on a square matrix dimension.
static constexpr int kDefaultMaxMatrixSize = 2000;

/**
 * @brief Dense row-major matrix of 32-bit integers.
 *
 * Element (i, j) is stored at index i * cols + j, so every row is contiguous
 * and a block of consecutive rows is a contiguous sub-range of data. A matrix
 * may have zero rows (the result of an empty chunk); the generator never
 * produces one.
 */
struct Matrix {
    int rows = 0; ///< Number of rows.
    int cols = 0; ///< Number of columns.
    std::vector<Element> data; ///< Row-major storage, rows * cols elements.

    Matrix() = default;

    /**
     * @brief Allocate a zero-initialized rows x cols matrix.
     */
    Matrix(int r, int c);

    Element& at(int row, int col) { return data[(std::size_t)row * cols + col]; }
    const Element& at(int row, int col) const { return data[(std::size_t)row * cols + col]; }

    /// Pointer to the first element of a row.
    const Element* rowData(int row) const { return data.data() + (std::size_t)row * cols; }

    Shape shape() const { return {rows, cols}; }

    /// Number of elements.
    std::size_t size() const { return data.size(); }

    /// Bytes occupied by the elements.
    std::size_t bytes() const { return data.size() * sizeof(Element); }

    bool operator==(const Matrix& other) const {
        return rows == other.rows && cols == other.cols && data == other.data;
    }
    bool operator!=(const Matrix& other) const { return !(*this == other); }
};

/**
 * @brief Descriptive summary of a matrix.
 */
struct MatrixInfo {
    Shape shape; ///< Rows and columns.
    std::string dtype; ///< Element type name ("int32").
    std::size_t size; ///< Number of elements.
    double memoryMb; ///< Storage in MiB.
    double min; ///< Smallest element (0 for an empty matrix).
    double max; ///< Largest element (0 for an empty matrix).
    double mean; ///< Arithmetic mean of the elements (0 for an empty matrix).
};


///////////////////////////
///    MATRIX SOURCE    ///
///////////////////////////
/**
 * @brief Produces operand matrices and checks their compatibility.
 *
 * Stateless: every member is a pure function of its arguments. A seed is
 * re-applied on each call, so two calls with the same (rows, cols, seed)
 * return identical matrices, including when both operands of a product are
 * generated with the same seed.
 */
class MatrixSource {
public:
    /**
     * @brief Generate a rows x cols matrix with entries uniform in [0, 100).
     *
     * @param rows Number of rows (>= 1).
     * @param cols Number of columns (>= 1).
     * @param seed Optional seed; when absent the engine is seeded from
     *             std::random_device.
     * @throws InvalidShape if rows or cols is not positive.
     */
    static Matrix generate(int rows, int cols, std::optional<std::uint32_t> seed = std::nullopt);

    /**
     * @brief True iff a * b is defined (a.cols == b.rows).
     */
    static bool compatible(const Matrix& a, const Matrix& b);

    /**
     * @brief Matrix with every element set to value.
     */
    static Matrix filled(int rows, int cols, Element value);

    /**
     * @brief n x n identity matrix.
     */
    static Matrix identity(int n);

    /**
     * @brief Shape, dtype, size, memory and min/max/mean of a matrix.
     */
    static MatrixInfo info(const Matrix& m);

    /**
     * @brief True iff 1 <= size <= maxSize.
     */
    static bool validSize(int size, int maxSize = kDefaultMaxMatrixSize);
};

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "kernel.hpp"
#include <cblas.h>
#include <algorithm>
#include <cmath>
#include <vector>


///////////////////////////
///       KERNEL        ///
///////////////////////////
Matrix multiplyRows(const Element* left, int rows, const Matrix& right) {
    const int inner = right.rows;
    const int cols = right.cols;

    Matrix result(rows, cols);
    if (rows == 0 || cols == 0) {
        return result;
    }

    std::vector<double> a(left, left + (std::size_t)rows * inner);
    std::vector<double> b(right.data.begin(), right.data.end());
    std::vector<double> c((std::size_t)rows * cols, 0.0);

    cblas_dgemm(CblasRowMajor, CblasNoTrans, CblasNoTrans,
                rows, cols, inner,
                1.0, a.data(), std::max(1, inner),
                     b.data(), std::max(1, cols),
                0.0, c.data(), cols);

    std::transform(c.begin(), c.end(), result.data.begin(),
                   [](double v) { return (Element)std::llround(v); });
    return result;
}

Matrix multiplyMatrices(const Matrix& a, const Matrix& b) {
    return multiplyRows(a.data.data(), a.rows, b);
}

Matrix multiplyChunk(const Chunk& chunk, const Matrix& right) {
    return multiplyRows(chunk.data(), chunk.rowCount, right);
}

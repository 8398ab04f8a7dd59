///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "matrix.hpp"
#include <algorithm>
#include <numeric>
#include <random>


///////////////////////////
///       MODELS        ///
///////////////////////////
Matrix::Matrix(int r, int c) : rows(r), cols(c) {
    data.assign((std::size_t)rows * cols, 0);
}


///////////////////////////
///    MATRIX SOURCE    ///
///////////////////////////
/**
 * @brief Fill a new matrix from a Mersenne Twister engine.
 *
 * A fresh engine is built per call, so a supplied seed fully determines the
 * output independently of any earlier generation.
 */
Matrix MatrixSource::generate(int rows, int cols, std::optional<std::uint32_t> seed) {
    if (rows < 1 || cols < 1) {
        throw InvalidShape({rows, cols});
    }

    std::mt19937 gen(seed ? *seed : std::random_device{}());
    std::uniform_int_distribution<Element> dist(0, kMaxGeneratedValue - 1);

    Matrix m(rows, cols);
    for (Element& v : m.data) {
        v = dist(gen);
    }
    return m;
}

bool MatrixSource::compatible(const Matrix& a, const Matrix& b) {
    return a.cols == b.rows;
}

Matrix MatrixSource::filled(int rows, int cols, Element value) {
    if (rows < 1 || cols < 1) {
        throw InvalidShape({rows, cols});
    }
    Matrix m(rows, cols);
    std::fill(m.data.begin(), m.data.end(), value);
    return m;
}

Matrix MatrixSource::identity(int n) {
    if (n < 1) {
        throw InvalidShape({n, n});
    }
    Matrix m(n, n);
    for (int i = 0; i < n; ++i) {
        m.at(i, i) = 1;
    }
    return m;
}

/**
 * @brief Summarize a matrix the way the benchmark header reports operands.
 */
MatrixInfo MatrixSource::info(const Matrix& m) {
    MatrixInfo info;
    info.shape = m.shape();
    info.dtype = "int32";
    info.size = m.size();
    info.memoryMb = (double)m.bytes() / (1024.0 * 1024.0);
    info.min = 0.0;
    info.max = 0.0;
    info.mean = 0.0;

    if (!m.data.empty()) {
        auto [lo, hi] = std::minmax_element(m.data.begin(), m.data.end());
        info.min = *lo;
        info.max = *hi;
        // Accumulate in 64 bits; the sum of int32 entries overflows quickly.
        long long sum = std::accumulate(m.data.begin(), m.data.end(), 0LL);
        info.mean = (double)sum / (double)m.data.size();
    }
    return info;
}

bool MatrixSource::validSize(int size, int maxSize) {
    return 1 <= size && size <= maxSize;
}

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "partitioner.hpp"
#include <algorithm>


///////////////////////////
///     PARTITIONER     ///
///////////////////////////
std::vector<int> Partitioner::rowCounts(int rows, int n) {
    if (n <= 0) {
        throw InvalidWorkerCount(n);
    }

    // First `remainder` chunks absorb one extra row each.
    int base = rows / n;
    int remainder = rows % n;

    std::vector<int> counts(n);
    for (int i = 0; i < n; ++i) {
        counts[i] = base + (i < remainder ? 1 : 0);
    }
    return counts;
}

std::vector<Chunk> Partitioner::split(const Matrix& a, int n) {
    std::vector<int> counts = rowCounts(a.rows, n);

    std::vector<Chunk> chunks;
    chunks.reserve(n);

    int currentRow = 0;
    for (int i = 0; i < n; ++i) {
        chunks.push_back(Chunk{i, currentRow, counts[i], &a});
        currentRow += counts[i];
    }
    return chunks;
}

Matrix Partitioner::slice(const Chunk& chunk) {
    Matrix m(chunk.rowCount, chunk.cols());
    if (!chunk.empty()) {
        std::copy(chunk.data(), chunk.data() + m.size(), m.data.begin());
    }
    return m;
}

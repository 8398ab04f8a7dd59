///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "partitioner.hpp"
#include "executor_base.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <numeric>


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST(PartitionerTest, CoversEveryRowWithBalancedChunks) {
    Matrix a = MatrixSource::generate(10, 4, 3u);

    for (int n = 1; n <= 12; ++n) {
        std::vector<Chunk> chunks = Partitioner::split(a, n);
        ASSERT_EQ((int)chunks.size(), n);

        int total = 0;
        int smallest = chunks.front().rowCount;
        int largest = chunks.front().rowCount;
        for (const Chunk& c : chunks) {
            total += c.rowCount;
            smallest = std::min(smallest, c.rowCount);
            largest = std::max(largest, c.rowCount);
        }
        EXPECT_EQ(total, a.rows) << "n = " << n;
        EXPECT_LE(largest - smallest, 1) << "n = " << n;
    }
}

TEST(PartitionerTest, RemainderGoesToLeadingChunks) {
    EXPECT_EQ(Partitioner::rowCounts(10, 3), (std::vector<int>{4, 3, 3}));
    EXPECT_EQ(Partitioner::rowCounts(7, 4), (std::vector<int>{2, 2, 2, 1}));
    EXPECT_EQ(Partitioner::rowCounts(8, 4), (std::vector<int>{2, 2, 2, 2}));
}

TEST(PartitionerTest, MoreWorkersThanRowsYieldsEmptyChunks) {
    Matrix a = MatrixSource::generate(3, 2, 5u);
    std::vector<Chunk> chunks = Partitioner::split(a, 5);

    ASSERT_EQ(chunks.size(), 5u);
    EXPECT_EQ(chunks[0].rowCount, 1);
    EXPECT_EQ(chunks[2].rowCount, 1);
    EXPECT_TRUE(chunks[3].empty());
    EXPECT_TRUE(chunks[4].empty());
    EXPECT_EQ(Partitioner::slice(chunks[4]).rows, 0);
    EXPECT_EQ(Partitioner::slice(chunks[4]).cols, 2);
}

TEST(PartitionerTest, NonPositiveWorkerCountIsRejected) {
    Matrix a = MatrixSource::generate(4, 4, 1u);
    EXPECT_THROW(Partitioner::split(a, 0), InvalidWorkerCount);
    EXPECT_THROW(Partitioner::split(a, -3), InvalidWorkerCount);
    EXPECT_THROW(Partitioner::rowCounts(4, 0), InvalidWorkerCount);
}

TEST(PartitionerTest, ConcatenatingChunksRestoresTheMatrix) {
    Matrix a = MatrixSource::generate(11, 7, 9u);
    std::vector<Chunk> chunks = Partitioner::split(a, 4);

    std::vector<Matrix> slices;
    int expectedFirst = 0;
    for (const Chunk& c : chunks) {
        EXPECT_EQ(c.firstRow, expectedFirst);
        expectedFirst += c.rowCount;
        slices.push_back(Partitioner::slice(c));
    }
    EXPECT_EQ(stackRows(slices, a.cols), a);
}

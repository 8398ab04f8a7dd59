///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "formatting.hpp"
#include <gtest/gtest.h>


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST(FormattingTest, TimeUnits) {
    EXPECT_EQ(formatTime(0.0000125), "12.50 μs");
    EXPECT_EQ(formatTime(0.0123), "12.30 ms");
    EXPECT_EQ(formatTime(0.5), "500.00 ms");
    EXPECT_EQ(formatTime(1.5), "1.5000 s");
    EXPECT_EQ(formatTime(12.34567), "12.3457 s");
}

TEST(FormattingTest, TimeThresholds) {
    EXPECT_EQ(formatTime(0.001), "1.00 ms");
    EXPECT_EQ(formatTime(1.0), "1.0000 s");
}

TEST(FormattingTest, ByteUnits) {
    EXPECT_EQ(formatBytes(512), "0.50 KB");
    EXPECT_EQ(formatBytes(1024 * 1024), "1.00 MB");
    EXPECT_EQ(formatBytes(3 * 1024 * 1024 / 2), "1.50 MB");
    EXPECT_EQ(formatBytes((std::size_t)2 * 1024 * 1024 * 1024), "2.00 GB");
}

TEST(FormattingTest, MemoryEstimateCoversThreeMatrices) {
    // 3 * 512 * 512 * 4 bytes = 3 MiB.
    EXPECT_EQ(estimateMemoryUsage(512), "3.00 MB");
    EXPECT_EQ(estimateMemoryUsage(512, 8), "6.00 MB");
}

TEST(FormattingTest, MatrixSize) {
    EXPECT_EQ(formatMatrixSize(500), "500 x 500");
}

TEST(FormattingTest, RecommendedWorkers) {
    EXPECT_EQ(recommendedWorkers(1), (std::vector<int>{1, 2}));
    EXPECT_EQ(recommendedWorkers(2), (std::vector<int>{1, 2}));
    EXPECT_EQ(recommendedWorkers(4), (std::vector<int>{1, 2, 4}));
    EXPECT_EQ(recommendedWorkers(6), (std::vector<int>{1, 2, 4, 8}));
    EXPECT_EQ(recommendedWorkers(8), (std::vector<int>{1, 2, 4, 8}));
    EXPECT_EQ(recommendedWorkers(32), (std::vector<int>{1, 2, 4, 8, 16}));
}

TEST(FormattingTest, AmdahlTableMarksUnboundedLimit) {
    AnalysisResult analysis = PerformanceAnalyzer::analyze(1.0, {{1, 1.0}, {2, 0.6}}, {0.5, 1.0});

    testing::internal::CaptureStdout();
    printAmdahlTable(analysis);
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_NE(out.find("unbounded"), std::string::npos);
    EXPECT_NE(out.find("2.000x"), std::string::npos);
}

TEST(FormattingTest, TimingTableReportsVerification) {
    MethodComparison comparison;
    comparison.sequentialTime = 0.002;
    comparison.parallelTimes[Strategy::SHARED_MEMORY_THREAD][2] = 0.001;
    comparison.resultsMatch = false;

    testing::internal::CaptureStdout();
    printTimingTable(comparison);
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_NE(out.find("shared-memory-thread"), std::string::npos);
    EXPECT_NE(out.find("2.00 ms"), std::string::npos);
    EXPECT_NE(out.find("ERROR"), std::string::npos);
}

TEST(FormattingTest, FlynnTaxonomyListsClassAndExamples) {
    testing::internal::CaptureStdout();
    printFlynnTaxonomy(PerformanceAnalyzer::flynnTaxonomy());
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_NE(out.find("MIMD (Multiple Instruction, Multiple Data)"), std::string::npos);
    EXPECT_NE(out.find("Computer clusters"), std::string::npos);
}

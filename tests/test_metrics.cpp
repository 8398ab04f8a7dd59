///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "metrics.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <limits>


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST(PerformanceAnalyzerTest, SpeedupAgainstItselfIsOne) {
    EXPECT_DOUBLE_EQ(PerformanceAnalyzer::speedup(2.5, 2.5), 1.0);
    EXPECT_DOUBLE_EQ(PerformanceAnalyzer::speedup(4.0, 1.0), 4.0);
}

TEST(PerformanceAnalyzerTest, ZeroParallelTimeGivesZeroSpeedup) {
    EXPECT_DOUBLE_EQ(PerformanceAnalyzer::speedup(3.0, 0.0), 0.0);
}

TEST(PerformanceAnalyzerTest, Efficiency) {
    EXPECT_DOUBLE_EQ(PerformanceAnalyzer::efficiency(3.0, 4), 0.75);
    EXPECT_DOUBLE_EQ(PerformanceAnalyzer::efficiency(3.0, 0), 0.0);
}

TEST(PerformanceAnalyzerTest, AmdahlBoundaries) {
    for (int n : {1, 2, 4, 8, 16}) {
        EXPECT_DOUBLE_EQ(PerformanceAnalyzer::amdahl(0.0, n), 1.0);
        EXPECT_DOUBLE_EQ(PerformanceAnalyzer::amdahl(1.0, n), (double)n);
    }
    for (double p : {0.0, 0.25, 0.6, 0.9, 1.0}) {
        EXPECT_DOUBLE_EQ(PerformanceAnalyzer::amdahl(p, 1), 1.0);
    }
    EXPECT_NEAR(PerformanceAnalyzer::amdahl(0.9, 4), 1.0 / (0.1 + 0.9 / 4), 1e-12);
}

TEST(PerformanceAnalyzerTest, AmdahlIsIncreasingAndBounded) {
    for (double p : {0.3, 0.6, 0.9, 0.99}) {
        double limit = PerformanceAnalyzer::maxTheoreticalSpeedup(p);
        double previous = PerformanceAnalyzer::amdahl(p, 1);
        for (int n = 2; n <= 64; ++n) {
            double s = PerformanceAnalyzer::amdahl(p, n);
            EXPECT_GT(s, previous) << "p = " << p << ", n = " << n;
            EXPECT_LT(s, limit) << "p = " << p << ", n = " << n;
            previous = s;
        }
    }
}

TEST(PerformanceAnalyzerTest, AmdahlRejectsInvalidArguments) {
    EXPECT_THROW(PerformanceAnalyzer::amdahl(-0.1, 4), InvalidFraction);
    EXPECT_THROW(PerformanceAnalyzer::amdahl(1.1, 4), InvalidFraction);
    EXPECT_THROW(PerformanceAnalyzer::amdahl(std::nan(""), 4), InvalidFraction);
    EXPECT_THROW(PerformanceAnalyzer::amdahl(0.5, 0), InvalidProcessorCount);
    EXPECT_THROW(PerformanceAnalyzer::amdahl(0.5, -2), InvalidProcessorCount);
}

TEST(PerformanceAnalyzerTest, AmdahlRangeTabulatesOneToMax) {
    std::map<int, double> table = PerformanceAnalyzer::amdahlRange(0.6, 8);
    ASSERT_EQ(table.size(), 8u);
    EXPECT_EQ(table.begin()->first, 1);
    EXPECT_EQ(table.rbegin()->first, 8);
    EXPECT_DOUBLE_EQ(table.at(4), PerformanceAnalyzer::amdahl(0.6, 4));

    EXPECT_THROW(PerformanceAnalyzer::amdahlRange(0.6, 0), InvalidProcessorCount);
    EXPECT_THROW(PerformanceAnalyzer::amdahlRange(2.0, 4), InvalidFraction);
}

TEST(PerformanceAnalyzerTest, MaxTheoreticalSpeedup) {
    EXPECT_DOUBLE_EQ(PerformanceAnalyzer::maxTheoreticalSpeedup(0.9), 1.0 / (1.0 - 0.9));
    EXPECT_DOUBLE_EQ(PerformanceAnalyzer::maxTheoreticalSpeedup(0.0), 1.0);

    double unbounded = PerformanceAnalyzer::maxTheoreticalSpeedup(1.0);
    EXPECT_TRUE(std::isinf(unbounded));
    EXPECT_TRUE(PerformanceAnalyzer::isUnbounded(unbounded));
    EXPECT_FALSE(PerformanceAnalyzer::isUnbounded(10.0));
    EXPECT_THROW(PerformanceAnalyzer::maxTheoreticalSpeedup(1.5), InvalidFraction);
}

TEST(PerformanceAnalyzerTest, AnalyzeBuildsEveryTable) {
    std::map<int, double> times = {{1, 2.0}, {2, 1.0}, {4, 0.8}};
    AnalysisResult r = PerformanceAnalyzer::analyze(2.0, times, {0.6, 0.9});

    EXPECT_DOUBLE_EQ(r.sequentialTime, 2.0);
    EXPECT_EQ(r.parallelTimes, times);
    EXPECT_DOUBLE_EQ(r.speedups.at(1), 1.0);
    EXPECT_DOUBLE_EQ(r.speedups.at(2), 2.0);
    EXPECT_DOUBLE_EQ(r.speedups.at(4), 2.5);
    EXPECT_DOUBLE_EQ(r.efficiencies.at(2), 1.0);
    EXPECT_DOUBLE_EQ(r.efficiencies.at(4), 0.625);

    ASSERT_EQ(r.amdahlPredictions.size(), 2u);
    EXPECT_EQ(r.amdahlPredictions.at(0.6).size(), 4u);
    EXPECT_EQ(r.amdahlPredictions.at(0.9).size(), 4u);
    EXPECT_DOUBLE_EQ(r.amdahlPredictions.at(0.9).at(3), PerformanceAnalyzer::amdahl(0.9, 3));
}

TEST(PerformanceAnalyzerTest, AnalyzeUsesDefaultFractions) {
    AnalysisResult r = PerformanceAnalyzer::analyze(1.0, {{2, 0.5}});
    ASSERT_EQ(r.amdahlPredictions.size(), kDefaultParallelFractions.size());
    for (double p : kDefaultParallelFractions) {
        EXPECT_EQ(r.amdahlPredictions.count(p), 1u);
    }
}

TEST(PerformanceAnalyzerTest, AnalyzeRequiresSamples) {
    EXPECT_THROW(PerformanceAnalyzer::analyze(1.0, {}), EmptyResultSet);
}

TEST(PerformanceAnalyzerTest, OptimalWorkersKeepsLastQualifyingCount) {
    std::map<int, double> speedups = {{1, 1.0}, {2, 1.9}, {4, 3.0}, {8, 3.2}};
    EXPECT_EQ(PerformanceAnalyzer::optimalWorkers(speedups, 0.7), 4);
}

TEST(PerformanceAnalyzerTest, OptimalWorkersDefaultsToOne) {
    EXPECT_EQ(PerformanceAnalyzer::optimalWorkers({}, 0.7), 1);
    EXPECT_EQ(PerformanceAnalyzer::optimalWorkers({{2, 0.5}, {4, 1.0}}, 0.7), 1);
}

TEST(PerformanceAnalyzerTest, OptimalWorkersPrefersLaterOverMoreEfficient) {
    // 2 workers at 100% and 8 workers at 75% both qualify; the later one wins.
    std::map<int, double> speedups = {{2, 2.0}, {4, 2.0}, {8, 6.0}};
    EXPECT_EQ(PerformanceAnalyzer::optimalWorkers(speedups, 0.7), 8);
}

TEST(PerformanceAnalyzerTest, FlynnTaxonomyIsMimd) {
    FlynnClassification flynn = PerformanceAnalyzer::flynnTaxonomy();
    EXPECT_EQ(flynn.classification, "MIMD");
    EXPECT_EQ(flynn.fullName, "Multiple Instruction, Multiple Data");
    EXPECT_FALSE(flynn.description.empty());
    EXPECT_FALSE(flynn.justification.empty());
    EXPECT_EQ(flynn.examples.size(), 3u);
}

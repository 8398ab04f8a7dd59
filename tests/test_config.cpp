///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "config.hpp"
#include <gtest/gtest.h>
#include <stdexcept>


///////////////////////////
///        TESTS        ///
///////////////////////////
TEST(ConfigTest, DefaultsReproduceReferenceRun) {
    BenchmarkConfig config = parseArgs(std::vector<std::string>{});
    EXPECT_EQ(config.matrixSize, 500);
    EXPECT_EQ(config.maxMatrixSize, 2000);
    EXPECT_TRUE(config.useSeed);
    EXPECT_EQ(config.seedA, 42u);
    EXPECT_EQ(config.seedB, 43u);
    EXPECT_EQ(config.parallelFractions, (std::vector<double>{0.6, 0.9}));
    EXPECT_DOUBLE_EQ(config.efficiencyThreshold, 0.7);
    EXPECT_EQ(config.blasThreads, 1);
    EXPECT_FALSE(config.serializeThreadKernel);
    EXPECT_EQ(config.strategies.size(), 3u);
    ASSERT_FALSE(config.workerCounts.empty());
    EXPECT_EQ(config.workerCounts.front(), 1);
}

TEST(ConfigTest, ParsesEveryFlag) {
    BenchmarkConfig config = parseArgs(std::vector<std::string>{
            "--size", "64", "--max-size", "128", "--workers", "1,3,5",
            "--strategy", "thread,process,thread", "--seed-a", "7", "--seed-b", "8",
            "--fractions", "0.5,0.75,1", "--threshold", "0.5", "--blas-threads", "2",
            "--serialize-threads"});

    EXPECT_EQ(config.matrixSize, 64);
    EXPECT_EQ(config.maxMatrixSize, 128);
    EXPECT_EQ(config.workerCounts, (std::vector<int>{1, 3, 5}));
    EXPECT_EQ(config.strategies,
              (std::vector<Strategy>{Strategy::SHARED_MEMORY_THREAD, Strategy::ISOLATED_PROCESS}));
    EXPECT_EQ(config.seedA, 7u);
    EXPECT_EQ(config.seedB, 8u);
    EXPECT_EQ(config.parallelFractions, (std::vector<double>{0.5, 0.75, 1.0}));
    EXPECT_DOUBLE_EQ(config.efficiencyThreshold, 0.5);
    EXPECT_EQ(config.blasThreads, 2);
    EXPECT_TRUE(config.serializeThreadKernel);
}

TEST(ConfigTest, NoSeedDisablesSeeding) {
    BenchmarkConfig config = parseArgs(std::vector<std::string>{"--no-seed"});
    EXPECT_FALSE(config.useSeed);
}

TEST(ConfigTest, AllSelectsEveryStrategy) {
    BenchmarkConfig config = parseArgs(std::vector<std::string>{"--strategy", "all"});
    EXPECT_EQ(config.strategies.size(), 3u);
}

TEST(ConfigTest, RejectsMalformedInput) {
    using Args = std::vector<std::string>;
    EXPECT_THROW(parseArgs(Args{"--size"}), std::invalid_argument);
    EXPECT_THROW(parseArgs(Args{"--size", "abc"}), std::invalid_argument);
    EXPECT_THROW(parseArgs(Args{"--size", "12x"}), std::invalid_argument);
    EXPECT_THROW(parseArgs(Args{"--bogus", "1"}), std::invalid_argument);
    EXPECT_THROW(parseArgs(Args{"--strategy", "gpu"}), std::invalid_argument);
    EXPECT_THROW(parseArgs(Args{"--seed-a", "-1"}), std::invalid_argument);
    EXPECT_THROW(parseArgs(Args{"--threshold", "0.5.1"}), std::invalid_argument);
}

TEST(ConfigTest, RejectsOutOfRangeValues) {
    using Args = std::vector<std::string>;
    EXPECT_THROW(parseArgs(Args{"--size", "0"}), std::invalid_argument);
    EXPECT_THROW(parseArgs(Args{"--size", "2001"}), std::invalid_argument);
    EXPECT_NO_THROW(parseArgs(Args{"--size", "3000", "--max-size", "4000"}));
    EXPECT_THROW(parseArgs(Args{"--workers", "2,0"}), std::invalid_argument);
    EXPECT_THROW(parseArgs(Args{"--workers", ","}), std::invalid_argument);
    EXPECT_THROW(parseArgs(Args{"--fractions", "0.5,1.2"}), std::invalid_argument);
    EXPECT_THROW(parseArgs(Args{"--threshold", "1.5"}), std::invalid_argument);
    EXPECT_THROW(parseArgs(Args{"--blas-threads", "0"}), std::invalid_argument);
}

TEST(ConfigTest, ArgvOverloadSkipsProgramName) {
    char program[] = "parmatmul_benchmark";
    char flag[] = "--size";
    char value[] = "32";
    char* argv[] = {program, flag, value};

    BenchmarkConfig config = parseArgs(3, argv);
    EXPECT_EQ(config.matrixSize, 32);
}

TEST(ConfigTest, UsageNamesProgram) {
    EXPECT_EQ(usage("bench").rfind("Usage: bench", 0), 0u);
}

#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "matrix.hpp"
#include "metrics.hpp"
#include "executor_base.hpp"
#include <cstdint>
#include <string>
#include <vector>


///////////////////////////
///       CONFIG        ///
///////////////////////////
/**
 * @brief Settings of a benchmark run.
 *
 * Defaults reproduce the reference experiment: two 500 x 500 operands seeded
 * with 42 and 43, every strategy, the worker counts recommended for this
 * machine, Amdahl tables for 60% and 90% parallel code.
 */
struct BenchmarkConfig {
    int matrixSize = 500; ///< Rows and columns of both square operands.
    int maxMatrixSize = kDefaultMaxMatrixSize; ///< Upper bound accepted for matrixSize.
    std::vector<int> workerCounts; ///< Parallel degrees to benchmark.
    std::vector<Strategy> strategies; ///< Strategies to benchmark.
    bool useSeed = true; ///< Seed the generator for reproducible operands.
    std::uint32_t seedA = 42; ///< Seed of the left operand.
    std::uint32_t seedB = 43; ///< Seed of the right operand.
    std::vector<double> parallelFractions = kDefaultParallelFractions; ///< Amdahl fractions to tabulate.
    double efficiencyThreshold = kDefaultEfficiencyThreshold; ///< Threshold for the recommendation.
    int blasThreads = 1; ///< Threads the CBLAS kernel may use internally.
    bool serializeThreadKernel = false; ///< Serialize kernels of the thread strategy.
};

/**
 * @brief Defaults, with worker counts derived from the logical CPU count.
 */
BenchmarkConfig defaultConfig();

/**
 * @brief Apply command-line flags on top of defaultConfig().
 *
 * Recognized flags: --size N, --max-size N, --workers 1,2,4,
 * --strategy all|process|thread|future[,...], --seed-a S, --seed-b S,
 * --no-seed, --fractions 0.6,0.9, --threshold T, --blas-threads K,
 * --serialize-threads.
 *
 * @throws std::invalid_argument for an unknown flag, a missing or malformed
 *         value, or a configuration that fails validateConfig().
 */
BenchmarkConfig parseArgs(const std::vector<std::string>& args);

/**
 * @brief Convenience overload for main(); skips argv[0].
 */
BenchmarkConfig parseArgs(int argc, char** argv);

/**
 * @brief Check ranges of every field.
 *
 * @throws std::invalid_argument describing the first invalid field.
 */
void validateConfig(const BenchmarkConfig& config);

/**
 * @brief One-line usage summary.
 */
std::string usage(const std::string& program);

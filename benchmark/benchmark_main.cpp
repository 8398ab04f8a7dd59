///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "config.hpp"
#include "dispatcher.hpp"
#include "formatting.hpp"
#include "matrix.hpp"
#include "metrics.hpp"
#include <cblas.h>
#include <iostream>
#include <optional>
#include <stdexcept>


///////////////////////////
///     ENTRY POINT     ///
///////////////////////////
/**
 * @brief Benchmark entry point comparing every parallel strategy.
 *
 * Generates two square operands, measures the sequential baseline and each
 * selected strategy at each selected worker count, verifies the parallel
 * products against the baseline, and prints speedup, efficiency and Amdahl's
 * Law predictions per strategy.
 */
int main(int argc, char** argv) {
    BenchmarkConfig config;
    try {
        config = parseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n" << usage(argv[0]) << "\n";
        return 1;
    }

    // Keep the kernel single-core by default so the baseline is sequential.
    openblas_set_num_threads(config.blasThreads);

    std::optional<std::uint32_t> seedA;
    std::optional<std::uint32_t> seedB;
    if (config.useSeed) {
        seedA = config.seedA;
        seedB = config.seedB;
    }

    Matrix a = MatrixSource::generate(config.matrixSize, config.matrixSize, seedA);
    Matrix b = MatrixSource::generate(config.matrixSize, config.matrixSize, seedB);

    printRunHeader(a, b, config.workerCounts);
    std::cout << "Size: " << formatMatrixSize(config.matrixSize)
              << " (estimated " << estimateMemoryUsage(config.matrixSize) << ")\n";
    std::cout << "Kernel threads: " << config.blasThreads
              << (config.serializeThreadKernel ? ", thread strategy serialized" : "") << "\n";

    DispatchOptions options;
    options.serializeThreadKernel = config.serializeThreadKernel;

    MethodComparison comparison;
    try {
        comparison = ParallelDispatcher::compareMethods(a, b, config.workerCounts, config.strategies, options);
    } catch (const MatmulError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    printTimingTable(comparison);

    // Amdahl tables depend only on the worker counts, so they are printed once.
    std::optional<AnalysisResult> last;
    for (const auto& [strategy, times] : comparison.parallelTimes) {
        last = PerformanceAnalyzer::analyze(comparison.sequentialTime, times, config.parallelFractions);
        printAnalysisTable(strategy, *last, config.efficiencyThreshold);
    }
    if (last) {
        printAmdahlTable(*last);
    }
    printFlynnTaxonomy(PerformanceAnalyzer::flynnTaxonomy());

    std::cout << "========================================\n";
    return comparison.resultsMatch ? 0 : 2;
}

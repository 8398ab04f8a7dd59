///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "formatting.hpp"
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>
#include <utility>


///////////////////////////
///       HELPERS       ///
///////////////////////////
std::string formatTime(double seconds) {
    std::stringstream ss;
    ss << std::fixed;
    if (seconds < 0.001) {
        ss << std::setprecision(2) << seconds * 1000000.0 << " μs";
    } else if (seconds < 1.0) {
        ss << std::setprecision(2) << seconds * 1000.0 << " ms";
    } else {
        ss << std::setprecision(4) << seconds << " s";
    }
    return ss.str();
}

std::string formatBytes(std::size_t bytes) {
    const double kib = 1024.0;
    const double mib = kib * 1024.0;
    const double gib = mib * 1024.0;
    double b = (double)bytes;

    std::stringstream ss;
    ss << std::fixed << std::setprecision(2);
    if (b < mib) {
        ss << b / kib << " KB";
    } else if (b < gib) {
        ss << b / mib << " MB";
    } else {
        ss << b / gib << " GB";
    }
    return ss.str();
}

std::string estimateMemoryUsage(int size, std::size_t bytesPerElement) {
    // Three same-sized square matrices: both operands and the product.
    std::size_t elements = 3 * (std::size_t)size * (std::size_t)size;
    return formatBytes(elements * bytesPerElement);
}

std::string formatMatrixSize(int size) {
    return std::to_string(size) + " x " + std::to_string(size);
}

std::vector<int> recommendedWorkers(int logicalCpus) {
    if (logicalCpus <= 2) return {1, 2};
    if (logicalCpus <= 4) return {1, 2, 4};
    if (logicalCpus <= 8) return {1, 2, 4, 8};
    return {1, 2, 4, 8, 16};
}

/**
 * @brief Format a ratio with 3 decimals and an "x" suffix ("1.234x").
 */
static std::string formatRatio(double value) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(3) << value << "x";
    return ss.str();
}

static std::string formatPercent(double value) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(2) << value * 100.0 << "%";
    return ss.str();
}

static void printSeparator() {
    std::cout << "========================================\n";
}


///////////////////////////
///      PRINTING       ///
///////////////////////////
/**
 * @brief Print operand shapes, value ranges and the memory estimate.
 */
void printRunHeader(const Matrix& a, const Matrix& b, const std::vector<int>& workerCounts) {
    MatrixInfo infoA = MatrixSource::info(a);
    MatrixInfo infoB = MatrixSource::info(b);

    printSeparator();
    std::cout << "PARALLEL MATRIX MULTIPLICATION BENCHMARK\n";
    printSeparator();
    for (const auto& [name, info] : {std::make_pair("A", infoA), std::make_pair("B", infoB)}) {
        std::stringstream mean;
        mean << std::fixed << std::setprecision(2) << info.mean;
        std::cout << "Matrix " << name << ": " << toString(info.shape) << ", " << info.dtype
                  << ", min=" << (long long)info.min << " max=" << (long long)info.max
                  << " mean=" << mean.str() << "\n";
    }
    std::cout << "Estimated memory: "
              << formatBytes(a.bytes() + b.bytes() + (std::size_t)a.rows * b.cols * sizeof(Element)) << "\n";

    std::cout << "Workers:";
    for (int w : workerCounts) std::cout << " " << w;
    std::cout << "\n";
}

/**
 * @brief Print one row per worker count and one column per strategy.
 *
 * Strategies are laid out side by side so that the cost of each isolation
 * model can be compared at the same parallel degree.
 */
void printTimingTable(const MethodComparison& comparison) {
    std::set<int> workerCounts;
    for (const auto& [strategy, times] : comparison.parallelTimes) {
        for (const auto& [workers, t] : times) {
            workerCounts.insert(workers);
        }
    }

    std::cout << "\nSequential baseline: " << formatTime(comparison.sequentialTime) << "\n\n";

    std::cout << "    " << std::left << std::setw(8) << "Workers";
    for (const auto& [strategy, times] : comparison.parallelTimes) {
        std::cout << " | " << std::left << std::setw(22) << strategyName(strategy);
    }
    std::cout << "\n";

    // Underline with a matching ASCII separator line.
    std::cout << "    " << std::string(8, '-');
    for (std::size_t i = 0; i < comparison.parallelTimes.size(); ++i) {
        std::cout << "-+-" << std::string(22, '-');
    }
    std::cout << "\n";

    for (int workers : workerCounts) {
        std::cout << "    " << std::left << std::setw(8) << workers;
        for (const auto& [strategy, times] : comparison.parallelTimes) {
            auto it = times.find(workers);
            std::string cell = it != times.end() ? formatTime(it->second) : "-";
            std::cout << " | " << std::left << std::setw(22) << cell;
        }
        std::cout << "\n";
    }

    std::cout << "\nVerification: "
              << (comparison.resultsMatch ? "OK, every parallel result matches the baseline"
                                          : "ERROR, parallel results differ from the baseline")
              << "\n";
}

void printAnalysisTable(Strategy strategy, const AnalysisResult& analysis, double threshold) {
    std::cout << "\n";
    printSeparator();
    std::cout << "ANALYSIS: " << strategyName(strategy) << "\n";
    printSeparator();

    std::cout << "    "
              << std::left << std::setw(8) << "Workers"
              << " | " << std::left << std::setw(12) << "Time"
              << " | " << std::left << std::setw(10) << "Speedup"
              << " | " << std::left << std::setw(10) << "Efficiency"
              << "\n";
    std::cout << "    "
              << std::string(8, '-')
              << "-+-" << std::string(12, '-')
              << "-+-" << std::string(10, '-')
              << "-+-" << std::string(10, '-')
              << "\n";

    for (const auto& [workers, t] : analysis.parallelTimes) {
        std::cout << "    "
                  << std::left << std::setw(8) << workers
                  << " | " << std::left << std::setw(12) << formatTime(t)
                  << " | " << std::left << std::setw(10) << formatRatio(analysis.speedups.at(workers))
                  << " | " << std::left << std::setw(10) << formatPercent(analysis.efficiencies.at(workers))
                  << "\n";
    }

    std::cout << "\nRecommended workers (efficiency >= " << formatPercent(threshold) << "): "
              << PerformanceAnalyzer::optimalWorkers(analysis.speedups, threshold) << "\n";
}

/**
 * @brief Print predicted speedups for every processor count and fraction.
 */
void printAmdahlTable(const AnalysisResult& analysis) {
    if (analysis.amdahlPredictions.empty()) return;

    std::cout << "\nAmdahl's Law predictions\n";
    std::cout << "    " << std::left << std::setw(10) << "Processors";
    for (const auto& [fraction, table] : analysis.amdahlPredictions) {
        std::cout << " | " << std::left << std::setw(10) << ("P=" + formatPercent(fraction));
    }
    std::cout << "\n";

    std::cout << "    " << std::string(10, '-');
    for (std::size_t i = 0; i < analysis.amdahlPredictions.size(); ++i) {
        std::cout << "-+-" << std::string(10, '-');
    }
    std::cout << "\n";

    const std::map<int, double>& first = analysis.amdahlPredictions.begin()->second;
    for (const auto& [processors, unused] : first) {
        (void)unused;
        std::cout << "    " << std::left << std::setw(10) << processors;
        for (const auto& [fraction, table] : analysis.amdahlPredictions) {
            std::cout << " | " << std::left << std::setw(10) << formatRatio(table.at(processors));
        }
        std::cout << "\n";
    }

    std::cout << "    " << std::left << std::setw(10) << "max";
    for (const auto& [fraction, table] : analysis.amdahlPredictions) {
        double limit = PerformanceAnalyzer::maxTheoreticalSpeedup(fraction);
        std::string cell = PerformanceAnalyzer::isUnbounded(limit) ? "unbounded" : formatRatio(limit);
        std::cout << " | " << std::left << std::setw(10) << cell;
    }
    std::cout << "\n";
}

void printFlynnTaxonomy(const FlynnClassification& flynn) {
    std::cout << "\nFlynn's taxonomy: " << flynn.classification << " (" << flynn.fullName << ")\n";
    std::cout << "    " << flynn.description << "\n";
    std::cout << "    Examples:";
    for (std::size_t i = 0; i < flynn.examples.size(); ++i) {
        std::cout << (i == 0 ? " " : ", ") << flynn.examples[i];
    }
    std::cout << "\n    " << flynn.justification << "\n";
}

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "metrics.hpp"
#include <cmath>
#include <limits>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static void checkFraction(double p) {
    // Written so that NaN fails as well.
    if (!(p >= 0.0 && p <= 1.0)) {
        throw InvalidFraction(p);
    }
}


///////////////////////////
///      ANALYZER       ///
///////////////////////////
double PerformanceAnalyzer::speedup(double seqTime, double parTime) {
    if (parTime == 0.0) {
        return 0.0;
    }
    return seqTime / parTime;
}

double PerformanceAnalyzer::efficiency(double speedup, int n) {
    if (n == 0) {
        return 0.0;
    }
    return speedup / n;
}

double PerformanceAnalyzer::amdahl(double p, int n) {
    checkFraction(p);
    if (n <= 0) {
        throw InvalidProcessorCount(n);
    }

    double serial = 1.0 - p;
    return 1.0 / (serial + p / n);
}

std::map<int, double> PerformanceAnalyzer::amdahlRange(double p, int maxN) {
    checkFraction(p);
    if (maxN <= 0) {
        throw InvalidProcessorCount(maxN);
    }

    std::map<int, double> table;
    for (int k = 1; k <= maxN; ++k) {
        table[k] = amdahl(p, k);
    }
    return table;
}

double PerformanceAnalyzer::maxTheoreticalSpeedup(double p) {
    checkFraction(p);

    double serial = 1.0 - p;
    if (serial == 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    return 1.0 / serial;
}

bool PerformanceAnalyzer::isUnbounded(double speedup) {
    return std::isinf(speedup) && speedup > 0;
}

AnalysisResult PerformanceAnalyzer::analyze(double seqTime, const std::map<int, double>& parTimes,
                                            const std::vector<double>& fractions) {
    if (parTimes.empty()) {
        throw EmptyResultSet();
    }

    AnalysisResult analysis;
    analysis.sequentialTime = seqTime;
    analysis.parallelTimes = parTimes;

    for (const auto& [workers, parTime] : parTimes) {
        double s = speedup(seqTime, parTime);
        analysis.speedups[workers] = s;
        analysis.efficiencies[workers] = efficiency(s, workers);
    }

    // Keys are ordered, so the last one is the largest worker count.
    int maxWorkers = parTimes.rbegin()->first;
    for (double fraction : fractions) {
        analysis.amdahlPredictions[fraction] = amdahlRange(fraction, maxWorkers);
    }
    return analysis;
}

/**
 * @brief Linear scan keeping the last worker count that meets the threshold.
 *
 * Deliberately not an arg-max over efficiency: with a non-monotonic curve
 * the later qualifying entry replaces an earlier, more efficient one.
 */
FlynnClassification PerformanceAnalyzer::flynnTaxonomy() {
    FlynnClassification flynn;
    flynn.classification = "MIMD";
    flynn.fullName = "Multiple Instruction, Multiple Data";
    flynn.description = "Several processors execute different instruction streams on different data "
                        "at the same time. This is the usual model of modern parallel systems.";
    flynn.examples = {"Multiprocessor systems", "Computer clusters", "Multicore CPUs"};
    flynn.justification = "Each worker (process or thread) multiplies its own row chunk independently, "
                          "with its own instruction stream and its own slice of the data, so different "
                          "cores run different instructions on different data simultaneously.";
    return flynn;
}

int PerformanceAnalyzer::optimalWorkers(const std::map<int, double>& speedups, double threshold) {
    int optimal = 1;
    for (const auto& [workers, s] : speedups) {
        if (efficiency(s, workers) >= threshold) {
            optimal = workers;
        }
    }
    return optimal;
}

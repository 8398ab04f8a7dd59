#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "errors.hpp"
#include <map>
#include <string>
#include <vector>


///////////////////////////
///        TYPES        ///
///////////////////////////
/// Parallel fractions tabulated by analyze() when none are requested.
static const std::vector<double> kDefaultParallelFractions = {0.6, 0.9};

/// Minimum efficiency for a worker count to be recommended.
static constexpr double kDefaultEfficiencyThreshold = 0.7;

/**
 * @brief Derived performance figures for one strategy.
 */
struct AnalysisResult {
    double sequentialTime; ///< Baseline seconds.
    std::map<int, double> parallelTimes; ///< workers -> seconds, as measured.
    std::map<int, double> speedups; ///< workers -> sequentialTime / parallel time.
    std::map<int, double> efficiencies; ///< workers -> speedup / workers.

    /// fraction -> (processors -> Amdahl speedup), for processors 1..max workers.
    std::map<double, std::map<int, double>> amdahlPredictions;
};

/**
 * @brief Flynn's taxonomy class of the benchmarked workload.
 */
struct FlynnClassification {
    std::string classification; ///< Short class name ("MIMD").
    std::string fullName; ///< Expanded name.
    std::string description; ///< What the class means.
    std::vector<std::string> examples; ///< Typical systems of the class.
    std::string justification; ///< Why the parallel strategies fall in this class.
};


///////////////////////////
///      ANALYZER       ///
///////////////////////////
/**
 * @brief Speedup, efficiency and Amdahl's Law calculations.
 *
 * Purely functional over its inputs. Degenerate but valid inputs (zero
 * parallel time, zero workers, p = 0 or p = 1) produce defined values;
 * only out-of-domain arguments raise.
 */
class PerformanceAnalyzer {
public:
    /**
     * @brief seqTime / parTime, or 0.0 when parTime is zero.
     */
    static double speedup(double seqTime, double parTime);

    /**
     * @brief speedup / n, or 0.0 when n is zero.
     */
    static double efficiency(double speedup, int n);

    /**
     * @brief Amdahl's Law: 1 / ((1 - p) + p / n).
     *
     * @param p Parallelizable fraction of the work, in [0, 1].
     * @param n Number of processors, >= 1.
     * @throws InvalidFraction if p is outside [0, 1].
     * @throws InvalidProcessorCount if n <= 0.
     */
    static double amdahl(double p, int n);

    /**
     * @brief amdahl(p, k) for k = 1..maxN, keyed by k.
     *
     * @throws InvalidFraction if p is outside [0, 1].
     * @throws InvalidProcessorCount if maxN <= 0.
     */
    static std::map<int, double> amdahlRange(double p, int maxN);

    /**
     * @brief Limit of amdahl(p, n) as n grows: 1 / (1 - p).
     *
     * Returns +infinity (see isUnbounded) when p == 1.
     *
     * @throws InvalidFraction if p is outside [0, 1].
     */
    static double maxTheoreticalSpeedup(double p);

    /**
     * @brief True for the value maxTheoreticalSpeedup() returns when p == 1.
     */
    static bool isUnbounded(double speedup);

    /**
     * @brief Speedup and efficiency per worker count plus Amdahl tables.
     *
     * One Amdahl table is produced per requested fraction, covering 1 up to
     * the largest worker count present in parTimes.
     *
     * @throws EmptyResultSet if parTimes is empty.
     * @throws InvalidFraction for a fraction outside [0, 1].
     */
    static AnalysisResult analyze(double seqTime, const std::map<int, double>& parTimes,
                                  const std::vector<double>& fractions = kDefaultParallelFractions);

    /**
     * @brief Largest worker count whose efficiency reaches threshold.
     *
     * Scans worker counts in increasing order and keeps the last one with
     * efficiency >= threshold, so a qualifying large count wins over a more
     * efficient small one. Returns 1 when no entry qualifies.
     */
    static int optimalWorkers(const std::map<int, double>& speedups,
                              double threshold = kDefaultEfficiencyThreshold);

    /**
     * @brief Flynn class of row-partitioned multiplication (always MIMD).
     */
    static FlynnClassification flynnTaxonomy();
};

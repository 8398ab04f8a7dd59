#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "matrix.hpp"
#include "metrics.hpp"
#include "dispatcher.hpp"
#include <cstddef>
#include <string>
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Human-readable duration.
 *
 * Below 1 ms: microseconds with 2 decimals ("12.34 μs"); below 1 s:
 * milliseconds with 2 decimals ("12.34 ms"); otherwise seconds with 4
 * decimals ("1.2345 s").
 */
std::string formatTime(double seconds);

/**
 * @brief Human-readable byte count in powers of 1024.
 *
 * Below 1 MiB: "x.xx KB"; below 1 GiB: "x.xx MB"; otherwise "x.xx GB".
 */
std::string formatBytes(std::size_t bytes);

/**
 * @brief Memory needed by three same-sized square matrices (both operands and the product).
 */
std::string estimateMemoryUsage(int size, std::size_t bytesPerElement = sizeof(Element));

/**
 * @brief "size x size".
 */
std::string formatMatrixSize(int size);

/**
 * @brief Worker counts worth benchmarking on a machine with logicalCpus CPUs.
 */
std::vector<int> recommendedWorkers(int logicalCpus);


///////////////////////////
///      PRINTING       ///
///////////////////////////
void printRunHeader(const Matrix& a, const Matrix& b, const std::vector<int>& workerCounts);

void printTimingTable(const MethodComparison& comparison);

void printAnalysisTable(Strategy strategy, const AnalysisResult& analysis, double threshold);

void printAmdahlTable(const AnalysisResult& analysis);

/**
 * @brief Print the Flynn classification of the parallel strategies.
 */
void printFlynnTaxonomy(const FlynnClassification& flynn);

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "config.hpp"
#include "formatting.hpp"
#include "matrix.hpp"
#include "metrics.hpp"
#include "mpi_executor.hpp"
#include "../sequential/sequential_executor.hpp"
#include <cblas.h>
#include <mpi.h>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <utility>

///////////////////////////
///     ENTRY POINT     ///
///////////////////////////

/**
 * @brief MPI entry point: isolated worker processes as MPI ranks.
 *
 * Rank 0 generates the operands from the configured seeds and measures the
 * sequential baseline. All ranks then run MpiRowExecutor with one chunk per
 * rank. Rank 0 verifies the product against the baseline and prints speedup,
 * efficiency and the Amdahl table for the world size.
 *
 * Run as: mpirun -np N parmatmul_mpi_benchmark [--size N] [--seed-a S] ...
 * (--workers and --strategy are ignored; the world size is the worker count).
 */
int main(int argc, char** argv) {
    MPI_Init(&argc, &argv);

    int rank, size;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    // Every rank parses the same arguments, so every rank agrees on failure.
    BenchmarkConfig config;
    try {
        config = parseArgs(argc, argv);
    } catch (const std::invalid_argument& e) {
        if (rank == 0) {
            std::cerr << "Error: " << e.what() << "\n" << usage(argv[0]) << "\n";
        }
        MPI_Finalize();
        return 1;
    }

    openblas_set_num_threads(config.blasThreads);

    Matrix a;
    Matrix b;
    double sequentialTime = 0.0;
    Matrix expected;

    if (rank == 0) {
        std::optional<std::uint32_t> seedA;
        std::optional<std::uint32_t> seedB;
        if (config.useSeed) {
            seedA = config.seedA;
            seedB = config.seedB;
        }
        a = MatrixSource::generate(config.matrixSize, config.matrixSize, seedA);
        b = MatrixSource::generate(config.matrixSize, config.matrixSize, seedB);

        std::cout << "========================================\n";
        std::cout << "MPI MATRIX MULTIPLICATION BENCHMARK\n";
        std::cout << "Processes: " << size << "\n";
        std::cout << "Size: " << formatMatrixSize(config.matrixSize)
                  << " (estimated " << estimateMemoryUsage(config.matrixSize) << ")\n";
        std::cout << "========================================\n";

        SequentialExecutor sequential;
        ExecutionResult baseline = sequential.multiply(a, b);
        sequentialTime = baseline.elapsed;
        expected = std::move(baseline.result);
    }

    MpiRowExecutor executor;
    std::optional<ExecutionResult> outcome;
    try {
        outcome = executor.multiply(a, b);
    } catch (const MatmulError& e) {
        if (rank == 0) {
            std::cerr << "Error: " << e.what() << "\n";
        }
        MPI_Finalize();
        return 1;
    }

    int status = 0;
    if (rank == 0 && outcome) {
        bool match = outcome->result == expected;
        std::cout << "\nSequential baseline: " << formatTime(sequentialTime) << "\n";
        std::cout << "MPI (" << size << " ranks):   " << formatTime(outcome->elapsed) << "\n";
        std::cout << "Verification: " << (match ? "OK" : "ERROR, results differ from the baseline") << "\n";

        std::map<int, double> parTimes = {{size, outcome->elapsed}};
        AnalysisResult analysis = PerformanceAnalyzer::analyze(sequentialTime, parTimes, config.parallelFractions);
        printAnalysisTable(Strategy::ISOLATED_PROCESS, analysis, config.efficiencyThreshold);
        printAmdahlTable(analysis);
        std::cout << "========================================\n";

        status = match ? 0 : 2;
    }

    MPI_Bcast(&status, 1, MPI_INT, 0, MPI_COMM_WORLD);
    MPI_Finalize();
    return status;
}

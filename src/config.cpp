///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "config.hpp"
#include "formatting.hpp"
#include <algorithm>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <thread>


///////////////////////////
///       HELPERS       ///
///////////////////////////
/**
 * @brief Split a comma separated list, dropping empty items.
 */
static std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

/**
 * @brief Parse a whole string as an int; trailing characters are an error.
 */
static int parseInt(const std::string& flag, const std::string& text) {
    try {
        std::size_t pos = 0;
        int value = std::stoi(text, &pos);
        if (pos == text.size()) return value;
    } catch (const std::logic_error&) {
        // Reported below with the flag name.
    }
    throw std::invalid_argument("Invalid integer for " + flag + ": '" + text + "'");
}

static double parseDouble(const std::string& flag, const std::string& text) {
    try {
        std::size_t pos = 0;
        double value = std::stod(text, &pos);
        if (pos == text.size()) return value;
    } catch (const std::logic_error&) {
        // Reported below with the flag name.
    }
    throw std::invalid_argument("Invalid number for " + flag + ": '" + text + "'");
}

static std::uint32_t parseSeed(const std::string& flag, const std::string& text) {
    try {
        std::size_t pos = 0;
        unsigned long value = std::stoul(text, &pos);
        if (pos == text.size() && value <= 0xFFFFFFFFul && text[0] != '-') {
            return (std::uint32_t)value;
        }
    } catch (const std::logic_error&) {
        // Reported below with the flag name.
    }
    throw std::invalid_argument("Invalid seed for " + flag + ": '" + text + "'");
}

static std::vector<Strategy> parseStrategies(const std::string& text) {
    if (text == "all") {
        return std::vector<Strategy>(std::begin(kAllStrategies), std::end(kAllStrategies));
    }
    std::vector<Strategy> strategies;
    for (const std::string& name : splitList(text)) {
        Strategy s = parseStrategy(name);
        if (std::find(strategies.begin(), strategies.end(), s) == strategies.end()) {
            strategies.push_back(s);
        }
    }
    return strategies;
}


///////////////////////////
///       CONFIG        ///
///////////////////////////
BenchmarkConfig defaultConfig() {
    BenchmarkConfig config;
    int cpus = (int)std::thread::hardware_concurrency();
    config.workerCounts = recommendedWorkers(cpus > 0 ? cpus : 1);
    config.strategies.assign(std::begin(kAllStrategies), std::end(kAllStrategies));
    return config;
}

BenchmarkConfig parseArgs(const std::vector<std::string>& args) {
    BenchmarkConfig config = defaultConfig();

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& flag = args[i];

        // Flags without a value.
        if (flag == "--no-seed") {
            config.useSeed = false;
            continue;
        }
        if (flag == "--serialize-threads") {
            config.serializeThreadKernel = true;
            continue;
        }

        if (i + 1 >= args.size()) {
            throw std::invalid_argument("Missing value for " + flag);
        }
        const std::string& value = args[++i];

        if (flag == "--size") {
            config.matrixSize = parseInt(flag, value);
        } else if (flag == "--max-size") {
            config.maxMatrixSize = parseInt(flag, value);
        } else if (flag == "--workers") {
            config.workerCounts.clear();
            for (const std::string& item : splitList(value)) {
                config.workerCounts.push_back(parseInt(flag, item));
            }
        } else if (flag == "--strategy") {
            config.strategies = parseStrategies(value);
        } else if (flag == "--seed-a") {
            config.seedA = parseSeed(flag, value);
        } else if (flag == "--seed-b") {
            config.seedB = parseSeed(flag, value);
        } else if (flag == "--fractions") {
            config.parallelFractions.clear();
            for (const std::string& item : splitList(value)) {
                config.parallelFractions.push_back(parseDouble(flag, item));
            }
        } else if (flag == "--threshold") {
            config.efficiencyThreshold = parseDouble(flag, value);
        } else if (flag == "--blas-threads") {
            config.blasThreads = parseInt(flag, value);
        } else {
            throw std::invalid_argument("Unknown option: " + flag);
        }
    }

    validateConfig(config);
    return config;
}

BenchmarkConfig parseArgs(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parseArgs(args);
}

void validateConfig(const BenchmarkConfig& config) {
    if (config.maxMatrixSize < 1) {
        throw std::invalid_argument("--max-size must be positive");
    }
    if (!MatrixSource::validSize(config.matrixSize, config.maxMatrixSize)) {
        throw std::invalid_argument("--size must be within 1.." + std::to_string(config.maxMatrixSize) +
                                    ", got " + std::to_string(config.matrixSize));
    }
    if (config.workerCounts.empty()) {
        throw std::invalid_argument("At least one worker count is required");
    }
    for (int w : config.workerCounts) {
        if (w < 1) {
            throw std::invalid_argument("Worker counts must be positive, got " + std::to_string(w));
        }
    }
    if (config.strategies.empty()) {
        throw std::invalid_argument("At least one strategy is required");
    }
    for (double p : config.parallelFractions) {
        if (!(p >= 0.0 && p <= 1.0)) {
            throw std::invalid_argument("Parallel fractions must be within [0, 1], got " + std::to_string(p));
        }
    }
    if (!(config.efficiencyThreshold >= 0.0 && config.efficiencyThreshold <= 1.0)) {
        throw std::invalid_argument("--threshold must be within [0, 1]");
    }
    if (config.blasThreads < 1) {
        throw std::invalid_argument("--blas-threads must be positive");
    }
}

std::string usage(const std::string& program) {
    return "Usage: " + program +
           " [--size N] [--max-size N] [--workers 1,2,4] [--strategy all|process|thread|future]"
           " [--seed-a S] [--seed-b S] [--no-seed] [--fractions 0.6,0.9] [--threshold T]"
           " [--blas-threads K] [--serialize-threads]";
}

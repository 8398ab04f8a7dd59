///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "errors.hpp"
#include <sstream>


///////////////////////////
///       HELPERS       ///
///////////////////////////
std::string toString(const Shape& s) {
    std::stringstream ss;
    ss << "(" << s.rows << ", " << s.cols << ")";
    return ss.str();
}

static std::string shapeMismatchMessage(Shape left, Shape right) {
    std::stringstream ss;
    ss << "Incompatible dimensions: " << toString(left) << " and " << toString(right)
       << " (left columns must equal right rows)";
    return ss.str();
}

static std::string dispatchFailureMessage(const std::string& strategy, int workers, const std::string& cause) {
    std::stringstream ss;
    ss << "Dispatch failed (" << strategy << ", " << workers << " workers): " << cause;
    return ss.str();
}


///////////////////////////
///       ERRORS        ///
///////////////////////////
ShapeMismatch::ShapeMismatch(Shape left, Shape right)
        : MatmulError(shapeMismatchMessage(left, right)),
          left_(left),
          right_(right) {}

InvalidShape::InvalidShape(Shape requested)
        : MatmulError("Matrix dimensions must be positive, got " + toString(requested)),
          requested_(requested) {}

InvalidWorkerCount::InvalidWorkerCount(int count)
        : MatmulError("Worker count must be at least 1, got " + std::to_string(count)),
          count_(count) {}

InvalidProcessorCount::InvalidProcessorCount(int count)
        : MatmulError("Processor count must be greater than 0, got " + std::to_string(count)),
          count_(count) {}

InvalidFraction::InvalidFraction(double fraction)
        : MatmulError("Parallel fraction must be within [0, 1], got " + std::to_string(fraction)),
          fraction_(fraction) {}

EmptyResultSet::EmptyResultSet()
        : MatmulError("Analysis requires at least one parallel timing sample") {}

DispatchFailure::DispatchFailure(const std::string& strategy, int workers, const std::string& cause)
        : MatmulError(dispatchFailureMessage(strategy, workers, cause)),
          strategy_(strategy),
          workers_(workers),
          cause_(cause) {}

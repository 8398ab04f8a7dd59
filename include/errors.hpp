#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include <stdexcept>
#include <string>


///////////////////////////
///        TYPES        ///
///////////////////////////
/**
 * @brief Rows x columns of a matrix, as carried in error payloads.
 */
struct Shape {
    int rows; ///< Number of rows.
    int cols; ///< Number of columns.
};

/**
 * @brief Render a shape as "(rows, cols)".
 */
std::string toString(const Shape& s);


///////////////////////////
///       ERRORS        ///
///////////////////////////
/**
 * @brief Base class of every error raised by the multiplication engine.
 *
 * All component failures derive from this type so callers can handle the
 * whole family with a single catch clause, or pick out the specific kind.
 */
class MatmulError : public std::runtime_error {
public:
    explicit MatmulError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Left and right operands cannot be multiplied (left.cols != right.rows).
 */
class ShapeMismatch : public MatmulError {
public:
    ShapeMismatch(Shape left, Shape right);

    Shape left() const { return left_; }
    Shape right() const { return right_; }

private:
    Shape left_;
    Shape right_;
};

/**
 * @brief A matrix was requested with a non-positive dimension.
 */
class InvalidShape : public MatmulError {
public:
    explicit InvalidShape(Shape requested);

    Shape requested() const { return requested_; }

private:
    Shape requested_;
};

/**
 * @brief A partition or dispatch was requested with fewer than one worker.
 */
class InvalidWorkerCount : public MatmulError {
public:
    explicit InvalidWorkerCount(int count);

    int count() const { return count_; }

private:
    int count_;
};

/**
 * @brief Amdahl's Law was evaluated for fewer than one processor.
 */
class InvalidProcessorCount : public MatmulError {
public:
    explicit InvalidProcessorCount(int count);

    int count() const { return count_; }

private:
    int count_;
};

/**
 * @brief A parallel fraction outside [0, 1] was supplied.
 */
class InvalidFraction : public MatmulError {
public:
    explicit InvalidFraction(double fraction);

    double fraction() const { return fraction_; }

private:
    double fraction_;
};

/**
 * @brief Analysis was requested without any parallel timing sample.
 */
class EmptyResultSet : public MatmulError {
public:
    EmptyResultSet();
};

/**
 * @brief A worker pool could not be built or one of its workers failed.
 *
 * The whole dispatch is aborted; no partial result is ever returned.
 */
class DispatchFailure : public MatmulError {
public:
    DispatchFailure(const std::string& strategy, int workers, const std::string& cause);

    const std::string& strategy() const { return strategy_; }
    int workers() const { return workers_; }
    const std::string& cause() const { return cause_; }

private:
    std::string strategy_;
    int workers_;
    std::string cause_;
};

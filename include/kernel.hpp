#pragma once

///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "matrix.hpp"
#include "partitioner.hpp"


///////////////////////////
///       KERNEL        ///
///////////////////////////
/**
 * @brief Multiply a block of row-major rows by a full right operand.
 *
 * Delegates to cblas_dgemm. The int32 operands are widened to double and the
 * product is rounded back; every partial sum of int32 products stays exact
 * as long as its magnitude is below 2^53, which holds for generated operands
 * (entries below 100) at any practical size.
 *
 * @param left  Pointer to rows x right.rows elements, row-major.
 * @param rows  Number of rows in the block (may be zero).
 * @param right Right operand.
 * @return rows x right.cols product.
 */
Matrix multiplyRows(const Element* left, int rows, const Matrix& right);

/**
 * @brief Full product a * b (caller has checked compatibility).
 */
Matrix multiplyMatrices(const Matrix& a, const Matrix& b);

/**
 * @brief Product of a chunk of the left operand with the full right operand.
 */
Matrix multiplyChunk(const Chunk& chunk, const Matrix& right);

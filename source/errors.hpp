#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "types.hpp"

namespace densemat {

class Matrix;

/**
 * @brief Closed set of failure kinds raised by the library.
 *
 * The numeric value of each enumerator is its stable error number.
 */
enum class ErrorCode : int {
    InvalidIndex      = 201,  // Row/column/selection index out of range
    IllegalMatrixSize = 202,  // Shape precondition failed
    NullMatrix        = 203,  // Operation on a matrix without storage
    MatrixFull        = 204,  // Legacy incremental fill ran out of rows
};

/**
 * @brief The single exception type thrown by densemat.
 *
 * Carries the failure kind next to the diagnostic message so callers can
 * dispatch on code() without a class hierarchy.
 */
class MatrixError : public std::runtime_error {
   public:
    MatrixError(ErrorCode code, const std::string& message);

    ErrorCode code() const noexcept { return code_; }
    int       errorNumber() const noexcept { return static_cast<int>(code_); }

    std::string_view codeName() const noexcept;
    std::string      errnoString() const;  // "JM###"

   private:
    ErrorCode code_;
};

std::string_view codeName(ErrorCode code) noexcept;
std::string_view defaultMessage(ErrorCode code) noexcept;

[[noreturn]] void raise(ErrorCode code, const std::string& message);

// Validation helpers. Each throws MatrixError at the point of detection.
void requireNonNull(const Matrix& m, std::string_view message);
void requireSquare(const Matrix& m, std::string_view message);
void requireSameShape(const Matrix& a, const Matrix& b, std::string_view operation);
void requireMultipliable(const Matrix& a, const Matrix& b);

/**
 * @brief Checks that a raw table can back a matrix.
 *
 * Empty tables (or an empty first row) are null matrices; jagged rows are a
 * size error.
 *
 * @param table Table to check
 * @param name  Name used in the diagnostic, e.g. "array A"
 */
void validateTable(const Table& table, std::string_view name);

Shape tableShape(const Table& table);

}  // namespace densemat

#include "errors.hpp"

#include "fmt/core.h"
#include "matrix.hpp"

namespace densemat {

MatrixError::MatrixError(ErrorCode code, const std::string& message)
    : std::runtime_error(message.empty() ? std::string(defaultMessage(code)) : message), code_(code) {}

std::string_view MatrixError::codeName() const noexcept {
    return densemat::codeName(code_);
}

std::string MatrixError::errnoString() const {
    return fmt::format("JM{}", errorNumber());
}

std::string_view codeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidIndex:
            return "INVIDX";
        case ErrorCode::IllegalMatrixSize:
            return "INVTYP";
        case ErrorCode::NullMatrix:
            return "NULLMT";
        case ErrorCode::MatrixFull:
            return "MTFULL";
    }
    return "UNKERR";
}

std::string_view defaultMessage(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::InvalidIndex:
            return "Given index is out of bounds";
        case ErrorCode::IllegalMatrixSize:
            return "Matrix has invalid size for this operation";
        case ErrorCode::NullMatrix:
            return "Matrix is null";
        case ErrorCode::MatrixFull:
            return "Matrix is already full";
    }
    return "Unknown error";
}

void raise(ErrorCode code, const std::string& message) {
    throw MatrixError(code, message);
}

void requireNonNull(const Matrix& m, std::string_view message) {
    if (m.isNull()) {
        raise(ErrorCode::NullMatrix, std::string(message));
    }
}

void requireSquare(const Matrix& m, std::string_view message) {
    requireNonNull(m, "Matrix is null. Please ensure the matrix have been initialized.");
    if (m.numRows() != m.numCols()) {
        raise(ErrorCode::IllegalMatrixSize,
              fmt::format("{} Matrix size: {}x{}", message, m.numRows(), m.numCols()));
    }
}

static void requireOperands(const Matrix& a, const Matrix& b, std::string_view operation) {
    if (a.isNull()) {
        raise(ErrorCode::NullMatrix,
              fmt::format("Matrix A is null. Please ensure the matrix are initialized before performing {}.", operation));
    }
    if (b.isNull()) {
        raise(ErrorCode::NullMatrix,
              fmt::format("Matrix B is null. Please ensure the matrix are initialized before performing {}.", operation));
    }
}

void requireSameShape(const Matrix& a, const Matrix& b, std::string_view operation) {
    requireOperands(a, b, operation);
    if (a.numRows() != b.numRows() || a.numCols() != b.numCols()) {
        raise(ErrorCode::IllegalMatrixSize,
              fmt::format("Cannot perform {} for two matrices with different dimensions. A = {}x{}, B = {}x{}",
                          operation, a.numRows(), a.numCols(), b.numRows(), b.numCols()));
    }
}

void requireMultipliable(const Matrix& a, const Matrix& b) {
    requireOperands(a, b, "multiplication");
    if (a.numCols() != b.numRows()) {
        raise(ErrorCode::IllegalMatrixSize,
              fmt::format("The number of columns in matrix A must equal the number of rows in matrix B. A = {}x{}, B = {}x{}",
                          a.numRows(), a.numCols(), b.numRows(), b.numCols()));
    }
}

void validateTable(const Table& table, std::string_view name) {
    if (table.empty() || table.front().empty()) {
        raise(ErrorCode::NullMatrix, fmt::format("Given {} is null or empty. Please ensure the array has valid elements.", name));
    }
    const auto cols = table.front().size();
    for (size_t r = 1; r < table.size(); ++r) {
        if (table[r].size() != cols) {
            raise(ErrorCode::IllegalMatrixSize,
                  fmt::format("Given {} has jagged rows: row {} has {} elements, expected {}", name, r, table[r].size(), cols));
        }
    }
}

Shape tableShape(const Table& table) {
    if (table.empty()) {
        return {};
    }
    return {static_cast<Index>(table.size()), static_cast<Index>(table.front().size())};
}

}  // namespace densemat

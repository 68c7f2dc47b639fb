#include <algorithm>
#include <cmath>

#include "fmt/core.h"
#include "matrix.hpp"

namespace densemat {

namespace {

    // Total order with NaN after every number
    bool lessNanLast(double a, double b) {
        return !std::isnan(a) && (std::isnan(b) || a < b);
    }

    constexpr const char* kNullMessage = "Matrix is null. Please ensure the matrix are initialized.";

    void checkIndex(Index index, Index wrapped, Index bound, std::string_view what) {
        if (wrapped < 0 || wrapped >= bound) {
            raise(ErrorCode::InvalidIndex, fmt::format("Given {} index is out of range: {}", what, index));
        }
    }

}  // namespace

Matrix Matrix::insertRow(Index row, const Row& values) const {
    requireNonNull(*this, kNullMessage);

    const Index rows = numRows();
    const Index cols = numCols();
    // -1 appends, so negative indices wrap over rows + 1 slots
    const Index at = row < 0 ? row + rows + 1 : row;
    checkIndex(row, at, rows + 1, "row");
    if (static_cast<Index>(values.size()) < cols) {
        raise(ErrorCode::IllegalMatrixSize,
              fmt::format("The length of array is less than matrix column count: {} < {}", values.size(), cols));
    }

    Storage result(rows + 1, cols);
    result.topRows(at)           = entries_.topRows(at);
    result.bottomRows(rows - at) = entries_.bottomRows(rows - at);
    for (Index c = 0; c < cols; ++c) {
        result(at, c) = values[static_cast<size_t>(c)];
    }
    return Matrix(std::move(result));
}

Matrix Matrix::insertColumn(Index col, const Row& values) const {
    requireNonNull(*this, kNullMessage);

    const Index rows = numRows();
    const Index cols = numCols();
    const Index at   = col < 0 ? col + cols + 1 : col;
    checkIndex(col, at, cols + 1, "column");
    if (static_cast<Index>(values.size()) < rows) {
        raise(ErrorCode::IllegalMatrixSize,
              fmt::format("The length of array is less than matrix row count: {} < {}", values.size(), rows));
    }

    Storage result(rows, cols + 1);
    result.leftCols(at)         = entries_.leftCols(at);
    result.rightCols(cols - at) = entries_.rightCols(cols - at);
    for (Index r = 0; r < rows; ++r) {
        result(r, at) = values[static_cast<size_t>(r)];
    }
    return Matrix(std::move(result));
}

Matrix Matrix::addRow(const Row& values) const {
    return insertRow(-1, values);
}

Matrix Matrix::addColumn(const Row& values) const {
    return insertColumn(-1, values);
}

Matrix Matrix::dropRow(Index row) const {
    requireNonNull(*this, kNullMessage);

    const Index rows = numRows();
    const Index at   = wrapIndex(row, rows);
    checkIndex(row, at, rows, "row");
    if (rows == 1) {
        raise(ErrorCode::IllegalMatrixSize, "Cannot drop the only row of the matrix");
    }

    Storage result(rows - 1, numCols());
    result.topRows(at)               = entries_.topRows(at);
    result.bottomRows(rows - at - 1) = entries_.bottomRows(rows - at - 1);
    return Matrix(std::move(result));
}

Matrix Matrix::dropColumn(Index col) const {
    requireNonNull(*this, kNullMessage);

    const Index cols = numCols();
    const Index at   = wrapIndex(col, cols);
    checkIndex(col, at, cols, "column");
    if (cols == 1) {
        raise(ErrorCode::IllegalMatrixSize, "Cannot drop the only column of the matrix");
    }

    Storage result(numRows(), cols - 1);
    result.leftCols(at)             = entries_.leftCols(at);
    result.rightCols(cols - at - 1) = entries_.rightCols(cols - at - 1);
    return Matrix(std::move(result));
}

Matrix Matrix::swapRows(Index row1, Index row2) const {
    requireNonNull(*this, kNullMessage);

    const Index a = wrapIndex(row1, numRows());
    const Index b = wrapIndex(row2, numRows());
    checkIndex(row1, a, numRows(), "row #1");
    checkIndex(row2, b, numRows(), "row #2");

    Storage result = entries_;
    result.row(a).swap(result.row(b));
    return Matrix(std::move(result));
}

Matrix Matrix::swapColumns(Index col1, Index col2) const {
    requireNonNull(*this, kNullMessage);

    const Index a = wrapIndex(col1, numCols());
    const Index b = wrapIndex(col2, numCols());
    checkIndex(col1, a, numCols(), "column #1");
    checkIndex(col2, b, numCols(), "column #2");

    Storage result = entries_;
    result.col(a).swap(result.col(b));
    return Matrix(std::move(result));
}

Matrix Matrix::minorMatrix(Index row, Index col) const {
    requireSquare(*this, "Matrix is not square. Please ensure the matrix have the same rows and columns size.");
    if (numRows() < 2) {
        raise(ErrorCode::IllegalMatrixSize, "Minor matrix requires at least a 2x2 matrix");
    }
    return dropRow(row).dropColumn(col);
}

void Matrix::sort() {
    requireNonNull(*this, "This matrix is null. Please ensure the matrix are initialized.");
    for (auto row : entries_.rowwise()) {
        std::sort(row.begin(), row.end(), lessNanLast);
    }
}

Matrix Matrix::sort(const Matrix& m) {
    Matrix sorted = m.deepCopy();
    sorted.sort();
    return sorted;
}

void Matrix::sort(Table& data) {
    validateTable(data, "array");
    for (auto& row : data) {
        std::sort(row.begin(), row.end(), lessNanLast);
    }
}

}  // namespace densemat

#include "matrix.hpp"

namespace densemat {

void Matrix::transpose() {
    requireNonNull(*this, "This matrix is null. Please ensure the matrix are initialized before performing transposition.");
    assign(transpose(*this).entries_);
}

Matrix Matrix::transpose(const Matrix& m) {
    requireNonNull(m, "Given matrix is null. Please ensure the matrix are initialized before performing transposition.");

    const Index rows = m.numRows();
    const Index cols = m.numCols();

    if (rows == cols) {
        Storage result(rows, cols);
        for (Index i = 0; i < rows; ++i) {
            for (Index j = 0; j < cols; ++j) {
                result(i, j) = m.entries_(j, i);
            }
        }
        return Matrix(std::move(result));
    }

    // Rectangular: the result has the dimensions swapped
    Storage result(cols, rows);
    for (Index i = 0; i < rows; ++i) {
        for (Index j = 0; j < cols; ++j) {
            result(j, i) = m.entries_(i, j);
        }
    }
    return Matrix(std::move(result));
}

Table Matrix::transpose(const Table& data) {
    return transpose(Matrix(toStorage(data, "array"))).getEntries();
}

double Matrix::trace() const {
    return trace(*this);
}

double Matrix::trace(const Matrix& m) {
    requireSquare(m, "Matrix is non-square type. Please ensure the matrix has the same number of rows and columns.");
    return m.entries_.trace();
}

double Matrix::trace(const Table& data) {
    return trace(Matrix(toStorage(data, "array")));
}

}  // namespace densemat

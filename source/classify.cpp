#include <algorithm>
#include <cmath>

#include "matrix.hpp"

namespace densemat {

namespace {

    bool isNonZero(double value) {
        return std::abs(value) > THRESHOLD;
    }

    constexpr const char* kNotSquareMessage =
        "Matrix is not square. Please ensure the matrix has the same number of rows and columns.";

}  // namespace

bool Matrix::isSquare() const {
    return isSquare(*this);
}

bool Matrix::isSquare(const Matrix& m) {
    requireNonNull(m, "Matrix is null. Please ensure the matrix have been initialized.");
    return m.numRows() == m.numCols();
}

bool Matrix::isSquare(const Table& data) {
    return isSquare(Matrix(toStorage(data, "array")));
}

bool Matrix::isDiagonal() const {
    return isDiagonal(*this);
}

bool Matrix::isDiagonal(const Matrix& m) {
    requireSquare(m, kNotSquareMessage);

    const Index n = m.numRows();
    for (Index i = 0; i < n; ++i) {
        for (Index j = 0; j < n; ++j) {
            if (i != j && isNonZero(m.entries_(i, j))) {
                return false;
            }
        }
    }
    return true;
}

bool Matrix::isDiagonal(const Table& data) {
    return isDiagonal(Matrix(toStorage(data, "array")));
}

bool Matrix::isLowerTriangular() const {
    return isLowerTriangular(*this);
}

bool Matrix::isLowerTriangular(const Matrix& m) {
    requireSquare(m, kNotSquareMessage);

    // Everything strictly above the main diagonal must vanish
    const Index n = m.numRows();
    for (Index i = 0; i < n; ++i) {
        for (Index j = i + 1; j < n; ++j) {
            if (isNonZero(m.entries_(i, j))) {
                return false;
            }
        }
    }
    return true;
}

bool Matrix::isLowerTriangular(const Table& data) {
    return isLowerTriangular(Matrix(toStorage(data, "array")));
}

bool Matrix::isUpperTriangular() const {
    return isUpperTriangular(*this);
}

bool Matrix::isUpperTriangular(const Matrix& m) {
    requireSquare(m, kNotSquareMessage);

    const Index n = m.numRows();
    for (Index i = 1; i < n; ++i) {
        for (Index j = 0; j < i; ++j) {
            if (isNonZero(m.entries_(i, j))) {
                return false;
            }
        }
    }
    return true;
}

bool Matrix::isUpperTriangular(const Table& data) {
    return isUpperTriangular(Matrix(toStorage(data, "array")));
}

bool Matrix::isSparse() const {
    return isSparse(*this);
}

bool Matrix::isSparse(const Matrix& m) {
    requireNonNull(m, "Matrix is null. Please ensure the matrix have been initialized.");

    Index nonZero = 0;
    for (Index r = 0; r < m.numRows(); ++r) {
        for (Index c = 0; c < m.numCols(); ++c) {
            if (isNonZero(m.entries_(r, c))) {
                ++nonZero;
            }
        }
    }
    return nonZero <= std::max(m.numRows(), m.numCols());
}

bool Matrix::isSparse(const Table& data) {
    return isSparse(Matrix(toStorage(data, "array")));
}

bool Matrix::isIdentity() const {
    return isIdentity(*this);
}

bool Matrix::isIdentity(const Matrix& m) {
    if (!isDiagonal(m)) {
        return false;
    }
    // Diagonal entries must be exactly one, not merely close to it
    for (Index i = 0; i < m.numRows(); ++i) {
        if (m.entries_(i, i) != 1.0) {
            return false;
        }
    }
    return true;
}

bool Matrix::isIdentity(const Table& data) {
    return isIdentity(Matrix(toStorage(data, "array")));
}

}  // namespace densemat

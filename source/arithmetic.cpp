#include "matrix.hpp"

namespace densemat {

// ============================================================================
// Addition
void Matrix::sum(const Matrix& m) {
    requireSameShape(*this, m, "addition");
    assign(Storage(entries_ + m.entries_));
}

void Matrix::sum(const Table& data) {
    sum(Matrix(data));
}

Matrix Matrix::sum(const Matrix& a, const Matrix& b) {
    requireSameShape(a, b, "addition");
    return Matrix(Storage(a.entries_ + b.entries_));
}

Table Matrix::sum(const Table& a, const Table& b) {
    return sum(Matrix(toStorage(a, "array A")), Matrix(toStorage(b, "array B"))).getEntries();
}

// ============================================================================
// Subtraction
void Matrix::sub(const Matrix& m) {
    requireSameShape(*this, m, "subtraction");
    assign(Storage(entries_ - m.entries_));
}

void Matrix::sub(const Table& data) {
    sub(Matrix(data));
}

Matrix Matrix::sub(const Matrix& a, const Matrix& b) {
    requireSameShape(a, b, "subtraction");
    return Matrix(Storage(a.entries_ - b.entries_));
}

Table Matrix::sub(const Table& a, const Table& b) {
    return sub(Matrix(toStorage(a, "array A")), Matrix(toStorage(b, "array B"))).getEntries();
}

// ============================================================================
// Multiplication
void Matrix::mult(const Matrix& m) {
    requireMultipliable(*this, m);
    // The product may change shape, so evaluate into a fresh table first
    assign(Storage(entries_ * m.entries_));
}

void Matrix::mult(const Table& data) {
    mult(Matrix(data));
}

Matrix Matrix::mult(const Matrix& a, const Matrix& b) {
    requireMultipliable(a, b);
    return Matrix(Storage(a.entries_ * b.entries_));
}

Table Matrix::mult(const Table& a, const Table& b) {
    return mult(Matrix(toStorage(a, "array A")), Matrix(toStorage(b, "array B"))).getEntries();
}

void Matrix::mult(double x) {
    requireNonNull(*this, "This matrix is null. Please ensure the matrix are initialized before performing scalar multiplication.");
    entries_ *= x;
}

Matrix Matrix::mult(const Matrix& m, double x) {
    requireNonNull(m, "Given matrix is null. Please ensure the matrix are initialized before performing scalar multiplication.");
    return Matrix(Storage(m.entries_ * x));
}

Table Matrix::mult(const Table& data, double x) {
    return mult(Matrix(toStorage(data, "array")), x).getEntries();
}

// ============================================================================
// Operators
Matrix& Matrix::operator+=(const Matrix& rhs) {
    sum(rhs);
    return *this;
}

Matrix& Matrix::operator-=(const Matrix& rhs) {
    sub(rhs);
    return *this;
}

Matrix& Matrix::operator*=(const Matrix& rhs) {
    mult(rhs);
    return *this;
}

Matrix& Matrix::operator*=(double x) {
    mult(x);
    return *this;
}

Matrix operator+(const Matrix& lhs, const Matrix& rhs) {
    return Matrix::sum(lhs, rhs);
}

Matrix operator-(const Matrix& lhs, const Matrix& rhs) {
    return Matrix::sub(lhs, rhs);
}

Matrix operator-(const Matrix& m) {
    return Matrix::mult(m, -1.0);
}

Matrix operator*(const Matrix& lhs, const Matrix& rhs) {
    return Matrix::mult(lhs, rhs);
}

Matrix operator*(const Matrix& m, double x) {
    return Matrix::mult(m, x);
}

Matrix operator*(double x, const Matrix& m) {
    return Matrix::mult(m, x);
}

}  // namespace densemat

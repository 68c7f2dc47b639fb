#pragma once

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

#include "errors.hpp"
#include "types.hpp"

namespace densemat {

/**
 * @brief Dense, real-valued matrix with value semantics.
 *
 * A default-constructed Matrix has no storage (the "null" matrix) and is
 * distinct from a zero matrix. Every copy path duplicates the entries, so two
 * Matrix values never share storage.
 *
 * Most operations come in three calling shapes:
 *  - instance form (`a.sum(b)`), which replaces the receiver's entries with the result
 *  - static form on two matrices (`Matrix::sum(a, b)`), which returns a new Matrix
 *  - static form on raw tables (`Matrix::sum(ta, tb)`), which returns a new Table
 *
 * Failures throw MatrixError before anything is mutated.
 */
class Matrix {
   public:
    Matrix() = default;
    Matrix(Index rows, Index cols);
    Matrix(Index rows, Index cols, double val);
    explicit Matrix(const Table& data);
    Matrix(std::initializer_list<std::initializer_list<double>> data);

    // Copies carry the entries only, never the selection cursor
    Matrix(const Matrix& other);
    Matrix& operator=(const Matrix& other);
    // Moves hand the selection over and disarm the source
    Matrix(Matrix&& other) noexcept;
    Matrix& operator=(Matrix&& other) noexcept;
    ~Matrix() = default;

    [[nodiscard]] static Matrix identity(Index n);
    [[nodiscard]] static Matrix fromEigen(const Storage& storage);

    /**
     * @brief Re-initialize this matrix as a rows x cols zero matrix.
     *
     * Supersedes any prior shape, content and selection.
     */
    void create(Index rows, Index cols);
    void create(const Table& data);

    [[nodiscard]] Matrix deepCopy() const;

    // ------------------------------------------------------------------
    // Accessors
    bool                 isNull() const noexcept { return entries_.size() == 0; }
    std::optional<Shape> shape() const;
    std::optional<Shape> getSize() const { return shape(); }
    Index                numRows() const noexcept { return entries_.rows(); }
    Index                numCols() const noexcept { return entries_.cols(); }

    /**
     * @brief Read one entry. Negative indices count from the end (-1 is the last row/column).
     * @throws MatrixError NullMatrix if uninitialized, InvalidIndex if out of range
     */
    double get(Index row, Index col) const;
    double getEntry(Index row, Index col) const { return get(row, col); }

    Table   getEntries() const;  // Always a copy; empty for a null matrix
    Row     row(Index index) const;
    Storage toEigen() const { return entries_; }

    // ------------------------------------------------------------------
    // Row selection / mutation
    /**
     * @brief Arm row `index` for the next change() call.
     * @return *this, so that `m.select(0).change({...})` chains
     */
    Matrix& select(Index index);

    /**
     * @brief Overwrite the selected row, then disarm the selection.
     *
     * @throws MatrixError InvalidIndex if no row is selected,
     *         IllegalMatrixSize if values.size() != numCols()
     */
    void change(std::initializer_list<double> values);
    void change(const Row& values);
    void change(double value);  // Fill the selected row with one value

    bool hasSelection() const noexcept { return hasSelection_; }

    void clear();

    // ------------------------------------------------------------------
    // Arithmetic
    void                 sum(const Matrix& m);
    void                 sum(const Table& data);
    [[nodiscard]] static Matrix sum(const Matrix& a, const Matrix& b);
    [[nodiscard]] static Table  sum(const Table& a, const Table& b);

    void                 sub(const Matrix& m);
    void                 sub(const Table& data);
    [[nodiscard]] static Matrix sub(const Matrix& a, const Matrix& b);
    [[nodiscard]] static Table  sub(const Table& a, const Table& b);

    void                 mult(const Matrix& m);
    void                 mult(const Table& data);
    void                 mult(double x);
    [[nodiscard]] static Matrix mult(const Matrix& a, const Matrix& b);
    [[nodiscard]] static Table  mult(const Table& a, const Table& b);
    [[nodiscard]] static Matrix mult(const Matrix& m, double x);
    [[nodiscard]] static Table  mult(const Table& data, double x);

    Matrix& operator+=(const Matrix& rhs);
    Matrix& operator-=(const Matrix& rhs);
    Matrix& operator*=(const Matrix& rhs);
    Matrix& operator*=(double x);

    // ------------------------------------------------------------------
    // Transpose / trace
    void                 transpose();
    [[nodiscard]] static Matrix transpose(const Matrix& m);
    [[nodiscard]] static Table  transpose(const Table& data);

    double        trace() const;
    static double trace(const Matrix& m);
    static double trace(const Table& data);

    // ------------------------------------------------------------------
    // Structural classification, all using THRESHOLD for "is zero"
    bool        isSquare() const;
    static bool isSquare(const Matrix& m);
    static bool isSquare(const Table& data);

    bool        isDiagonal() const;
    static bool isDiagonal(const Matrix& m);
    static bool isDiagonal(const Table& data);

    bool        isLowerTriangular() const;
    static bool isLowerTriangular(const Matrix& m);
    static bool isLowerTriangular(const Table& data);

    bool        isUpperTriangular() const;
    static bool isUpperTriangular(const Matrix& m);
    static bool isUpperTriangular(const Table& data);

    /**
     * @brief Sparse iff the count of nonzero entries does not exceed max(rows, cols).
     */
    bool        isSparse() const;
    static bool isSparse(const Matrix& m);
    static bool isSparse(const Table& data);

    // Diagonal with every diagonal entry exactly 1.0
    bool        isIdentity() const;
    static bool isIdentity(const Matrix& m);
    static bool isIdentity(const Table& data);

    // ------------------------------------------------------------------
    // Equality. Exact, unlike the classifiers.
    bool        equals(const Matrix& other) const;
    bool        operator==(const Matrix& other) const { return equals(other); }
    bool        shapeEquals(const Matrix& other) const;
    static bool shapeEquals(const Matrix& a, const Matrix& b);
    size_t      hashCode() const;

    // ------------------------------------------------------------------
    // Structural editing. These return a new matrix and leave *this untouched.
    [[nodiscard]] Matrix insertRow(Index row, const Row& values) const;
    [[nodiscard]] Matrix insertColumn(Index col, const Row& values) const;
    [[nodiscard]] Matrix addRow(const Row& values) const;
    [[nodiscard]] Matrix addColumn(const Row& values) const;
    [[nodiscard]] Matrix dropRow(Index row) const;
    [[nodiscard]] Matrix dropColumn(Index col) const;
    [[nodiscard]] Matrix swapRows(Index row1, Index row2) const;
    [[nodiscard]] Matrix swapColumns(Index col1, Index col2) const;
    [[nodiscard]] Matrix minorMatrix(Index row, Index col) const;

    void                 sort();  // Sort each row ascending
    [[nodiscard]] static Matrix sort(const Matrix& m);
    static void          sort(Table& data);

    // "[   [a, b],\n    [c, d]   ]", or "<null_matrix>" when uninitialized
    std::string toString() const;

   private:
    Storage entries_;
    Index   selectedRow_  = 0;
    bool    hasSelection_ = false;

    explicit Matrix(Storage&& storage);

    // Replace the entries wholesale; any pending selection no longer applies
    void assign(Storage&& storage);
    void resetSelection() noexcept;

    static Storage toStorage(const Table& data, std::string_view name);
    static Table   toTable(const Storage& storage);
    static Index   wrapIndex(Index index, Index bound) noexcept;
};

Matrix operator+(const Matrix& lhs, const Matrix& rhs);
Matrix operator-(const Matrix& lhs, const Matrix& rhs);
Matrix operator-(const Matrix& m);
Matrix operator*(const Matrix& lhs, const Matrix& rhs);
Matrix operator*(const Matrix& m, double x);
Matrix operator*(double x, const Matrix& m);

}  // namespace densemat

template <>
struct std::hash<densemat::Matrix> {
    size_t operator()(const densemat::Matrix& m) const noexcept { return m.hashCode(); }
};

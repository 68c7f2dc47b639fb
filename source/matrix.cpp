#include "matrix.hpp"

#include <utility>

#include "fmt/core.h"

namespace densemat {

static void validateSize(Index rows, Index cols) {
    if (rows <= 0 || cols <= 0) {
        raise(ErrorCode::IllegalMatrixSize,
              fmt::format("Matrix size cannot be lower than or equal to zero: {}x{}", rows, cols));
    }
}

Matrix::Matrix(Index rows, Index cols) : Matrix(rows, cols, 0.0) {}

Matrix::Matrix(Index rows, Index cols, double val) {
    validateSize(rows, cols);
    entries_ = Storage::Constant(rows, cols, val);
}

Matrix::Matrix(const Table& data) : entries_(toStorage(data, "array")) {}

Matrix::Matrix(std::initializer_list<std::initializer_list<double>> data) {
    Table table;
    table.reserve(data.size());
    for (const auto& row : data) {
        table.emplace_back(row);
    }
    entries_ = toStorage(table, "array");
}

Matrix::Matrix(Storage&& storage) : entries_(std::move(storage)) {}

Matrix::Matrix(const Matrix& other) : entries_(other.entries_) {}

Matrix& Matrix::operator=(const Matrix& other) {
    if (this != &other) {
        entries_ = other.entries_;
        resetSelection();
    }
    return *this;
}

Matrix::Matrix(Matrix&& other) noexcept
    : entries_(std::move(other.entries_)), selectedRow_(other.selectedRow_), hasSelection_(other.hasSelection_) {
    other.resetSelection();
}

Matrix& Matrix::operator=(Matrix&& other) noexcept {
    if (this != &other) {
        entries_      = std::move(other.entries_);
        selectedRow_  = other.selectedRow_;
        hasSelection_ = other.hasSelection_;
        other.resetSelection();
    }
    return *this;
}

Matrix Matrix::identity(Index n) {
    if (n < 1) {
        raise(ErrorCode::IllegalMatrixSize, fmt::format("Identity matrix size must be at least 1, got {}", n));
    }
    return Matrix(Storage(Storage::Identity(n, n)));
}

Matrix Matrix::fromEigen(const Storage& storage) {
    if (storage.size() == 0) {
        raise(ErrorCode::NullMatrix, "Given Eigen matrix is empty. Please ensure the matrix has valid elements.");
    }
    return Matrix(Storage(storage));
}

void Matrix::create(Index rows, Index cols) {
    validateSize(rows, cols);
    assign(Storage(Storage::Zero(rows, cols)));
}

void Matrix::create(const Table& data) {
    assign(toStorage(data, "array"));
}

Matrix Matrix::deepCopy() const {
    return Matrix(Storage(entries_));
}

std::optional<Shape> Matrix::shape() const {
    if (isNull()) {
        return std::nullopt;
    }
    return Shape{entries_.rows(), entries_.cols()};
}

double Matrix::get(Index row, Index col) const {
    requireNonNull(*this, "Matrix is null. Please ensure the matrix are initialized.");

    const Index r = wrapIndex(row, numRows());
    const Index c = wrapIndex(col, numCols());
    if (r < 0 || r >= numRows()) {
        raise(ErrorCode::InvalidIndex,
              fmt::format("Invalid row index: {} (matrix size: {}x{})", row, numRows(), numCols()));
    }
    if (c < 0 || c >= numCols()) {
        raise(ErrorCode::InvalidIndex,
              fmt::format("Invalid column index: {} (matrix size: {}x{})", col, numRows(), numCols()));
    }
    return entries_(r, c);
}

Table Matrix::getEntries() const {
    return toTable(entries_);
}

Row Matrix::row(Index index) const {
    requireNonNull(*this, "Matrix is null. Please ensure the matrix are initialized.");

    const Index r = wrapIndex(index, numRows());
    if (r < 0 || r >= numRows()) {
        raise(ErrorCode::InvalidIndex,
              fmt::format("Invalid row index: {} (matrix size: {}x{})", index, numRows(), numCols()));
    }
    const auto view = entries_.row(r);
    return Row(view.begin(), view.end());
}

Matrix& Matrix::select(Index index) {
    requireNonNull(*this, "Matrix is null. Please ensure the matrix are initialized.");
    if (index < 0) {
        raise(ErrorCode::InvalidIndex,
              fmt::format("Given index is negative value: {}. Please ensure the index is positive value.", index));
    }
    if (index >= numRows()) {
        raise(ErrorCode::InvalidIndex,
              fmt::format("Given index is too large for matrix with {} rows: {}", numRows(), index));
    }

    selectedRow_  = index;
    hasSelection_ = true;
    return *this;
}

void Matrix::change(std::initializer_list<double> values) {
    change(Row(values));
}

void Matrix::change(const Row& values) {
    if (!hasSelection_) {
        raise(ErrorCode::InvalidIndex,
              "Selected index is null. Please ensure you have already called \"select(index)\" method.");
    }
    if (static_cast<Index>(values.size()) != numCols()) {
        raise(ErrorCode::IllegalMatrixSize,
              fmt::format("{} values for matrix with columns: {} (got {})",
                          static_cast<Index>(values.size()) > numCols() ? "Too many" : "Not enough",
                          numCols(), values.size()));
    }

    for (Index c = 0; c < numCols(); ++c) {
        entries_(selectedRow_, c) = values[static_cast<size_t>(c)];
    }
    resetSelection();
}

void Matrix::change(double value) {
    if (!hasSelection_) {
        raise(ErrorCode::InvalidIndex,
              "Selected index is null. Please ensure you have already called \"select(index)\" method.");
    }

    entries_.row(selectedRow_).setConstant(value);
    resetSelection();
}

void Matrix::clear() {
    requireNonNull(*this, "Matrix is null. Please ensure the matrix have been initialized.");
    entries_.setZero();
}

void Matrix::assign(Storage&& storage) {
    entries_ = std::move(storage);
    resetSelection();
}

void Matrix::resetSelection() noexcept {
    selectedRow_  = 0;
    hasSelection_ = false;
}

Storage Matrix::toStorage(const Table& data, std::string_view name) {
    validateTable(data, name);

    const auto [rows, cols] = tableShape(data);
    Storage storage(rows, cols);
    for (Index r = 0; r < rows; ++r) {
        const auto& row = data[static_cast<size_t>(r)];
        for (Index c = 0; c < cols; ++c) {
            storage(r, c) = row[static_cast<size_t>(c)];
        }
    }
    return storage;
}

Table Matrix::toTable(const Storage& storage) {
    Table table;
    table.reserve(static_cast<size_t>(storage.rows()));
    for (Index r = 0; r < storage.rows(); ++r) {
        const auto view = storage.row(r);
        table.emplace_back(view.begin(), view.end());
    }
    return table;
}

Index Matrix::wrapIndex(Index index, Index bound) noexcept {
    return index < 0 ? index + bound : index;
}

}  // namespace densemat

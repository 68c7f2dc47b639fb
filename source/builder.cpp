#include "builder.hpp"

#include "fmt/core.h"

namespace densemat {

MatrixBuilder::MatrixBuilder(Index rows, Index cols) : rows_(rows), cols_(cols) {
    if (rows <= 0 || cols <= 0) {
        raise(ErrorCode::IllegalMatrixSize,
              fmt::format("Matrix size cannot be lower than or equal to zero: {}x{}", rows, cols));
    }
    table_.assign(static_cast<size_t>(rows), Row(static_cast<size_t>(cols), 0.0));
}

MatrixBuilder& MatrixBuilder::add(std::initializer_list<double> values) {
    return add(Row(values));
}

MatrixBuilder& MatrixBuilder::add(const Row& values) {
    requireCapacity();
    const auto count = static_cast<Index>(values.size());
    if (count != cols_) {
        raise(ErrorCode::IllegalMatrixSize,
              fmt::format("{} arguments for matrix with columns {} (got {})",
                          count > cols_ ? "Too many" : "Not enough", cols_, count));
    }

    table_[static_cast<size_t>(filled_++)] = values;
    return *this;
}

MatrixBuilder& MatrixBuilder::add(double value) {
    requireCapacity();
    table_[static_cast<size_t>(filled_++)].assign(static_cast<size_t>(cols_), value);
    return *this;
}

Matrix MatrixBuilder::build() const {
    return Matrix(table_);
}

void MatrixBuilder::requireCapacity() const {
    if (isFull()) {
        raise(ErrorCode::MatrixFull, "Cannot add values anymore, Matrix is already full");
    }
}

}  // namespace densemat

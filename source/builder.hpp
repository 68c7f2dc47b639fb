#pragma once

#include <initializer_list>

#include "matrix.hpp"
#include "types.hpp"

namespace densemat {

/**
 * @brief Row-by-row filler for a fixed-size matrix.
 *
 * Keeps the fill cursor out of Matrix itself. Prefer constructing a Matrix
 * from a complete Table; this exists for callers that produce rows one at a time.
 */
class MatrixBuilder {
   public:
    MatrixBuilder(Index rows, Index cols);

    // Append one row; values.size() must equal the column count
    MatrixBuilder& add(std::initializer_list<double> values);
    MatrixBuilder& add(const Row& values);
    MatrixBuilder& add(double value);  // Append a row filled with one value

    bool  isFull() const noexcept { return filled_ >= rows_; }
    Index filledRows() const noexcept { return filled_; }

    // Rows that were never added stay zero
    [[nodiscard]] Matrix build() const;

   private:
    Index rows_;
    Index cols_;
    Index filled_ = 0;
    Table table_;

    void requireCapacity() const;
};

}  // namespace densemat

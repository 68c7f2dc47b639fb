#pragma once

#include <vector>

#include "Eigen/Dense"

namespace densemat {

using Index = Eigen::Index;

// Row-major so that a row of the table is one contiguous block
using Storage = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

using Row   = std::vector<double>;
using Table = std::vector<Row>;

struct Shape {
    Index rows = 0;
    Index cols = 0;

    bool operator==(const Shape&) const = default;
};

// Anything with |x| <= THRESHOLD is treated as zero by the classifiers
inline constexpr double THRESHOLD = 1e-6;

inline constexpr const char* NULL_MATRIX_TOKEN = "<null_matrix>";

}  // namespace densemat

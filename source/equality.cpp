#include <cmath>
#include <functional>

#include "matrix.hpp"

namespace densemat {

namespace {

    void hashCombine(size_t& seed, size_t value) {
        seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }

}  // namespace

bool Matrix::equals(const Matrix& other) const {
    if (this == &other) {
        return true;
    }
    if (isNull() || other.isNull()) {
        return isNull() && other.isNull();
    }
    if (!shapeEquals(other)) {
        return false;
    }
    // Exact comparison; the classifiers are the only threshold-based checks
    return (entries_.array() == other.entries_.array()).all();
}

bool Matrix::shapeEquals(const Matrix& other) const {
    return shapeEquals(*this, other);
}

bool Matrix::shapeEquals(const Matrix& a, const Matrix& b) {
    if (a.isNull() || b.isNull()) {
        return false;
    }
    return a.numRows() == b.numRows() && a.numCols() == b.numCols();
}

size_t Matrix::hashCode() const {
    const Index cells = numRows() * numCols();
    size_t      seed  = static_cast<size_t>(std::abs(1.0e7 * std::sin(static_cast<double>(cells)))) * 43;

    hashCombine(seed, std::hash<Index>{}(numRows()));
    hashCombine(seed, std::hash<Index>{}(numCols()));
    for (Index r = 0; r < numRows(); ++r) {
        for (Index c = 0; c < numCols(); ++c) {
            const double value = entries_(r, c);
            // -0.0 == 0.0, so both must hash alike
            hashCombine(seed, std::hash<double>{}(value == 0.0 ? 0.0 : value));
        }
    }
    return seed;
}

}  // namespace densemat

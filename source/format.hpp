#pragma once

#include <iosfwd>
#include <string>

#include "errors.hpp"
#include "fmt/core.h"
#include "matrix.hpp"

namespace densemat {

// Shortest round-trip form, with ".0" kept on integral values: 7.0, -0.25, 1e-07
std::string formatValue(double value);

// One row as "[a, b, c]"; "<null_matrix>" when m is uninitialized
std::string formatRow(const Matrix& m, Index index);

std::string formatError(const MatrixError& err);

std::ostream& operator<<(std::ostream& os, const Matrix& m);

}  // namespace densemat

// ============================================================================
// Matrix / MatrixError formatting for fmt::format
template <>
struct fmt::formatter<densemat::Matrix> {
    constexpr auto parse(fmt::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const densemat::Matrix& m, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}", m.toString());
    }
};

template <>
struct fmt::formatter<densemat::MatrixError> {
    constexpr auto parse(fmt::format_parse_context& ctx) {
        return ctx.begin();
    }

    auto format(const densemat::MatrixError& err, fmt::format_context& ctx) const {
        return fmt::format_to(ctx.out(), "{}", densemat::formatError(err));
    }
};

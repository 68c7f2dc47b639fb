#include "format.hpp"

#include <iterator>
#include <ostream>

#include "fmt/format.h"

namespace densemat {

std::string formatValue(double value) {
    std::string text = fmt::format("{}", value);
    // "inf" and "nan" contain an 'n', exponent forms an 'e'
    if (text.find_first_of(".en") == std::string::npos) {
        text += ".0";
    }
    return text;
}

static void appendRow(fmt::memory_buffer& out, const Row& row) {
    out.push_back('[');
    for (size_t c = 0; c < row.size(); ++c) {
        if (c != 0) {
            fmt::format_to(std::back_inserter(out), ", ");
        }
        fmt::format_to(std::back_inserter(out), "{}", formatValue(row[c]));
    }
    out.push_back(']');
}

std::string Matrix::toString() const {
    if (isNull()) {
        return NULL_MATRIX_TOKEN;
    }

    fmt::memory_buffer out;
    fmt::format_to(std::back_inserter(out), "[   ");
    const Table table = getEntries();
    for (size_t r = 0; r < table.size(); ++r) {
        appendRow(out, table[r]);
        if (r != table.size() - 1) {
            fmt::format_to(std::back_inserter(out), ",\n    ");
        }
    }
    fmt::format_to(std::back_inserter(out), "   ]");
    return fmt::to_string(out);
}

std::string formatRow(const Matrix& m, Index index) {
    if (m.isNull()) {
        return NULL_MATRIX_TOKEN;
    }

    fmt::memory_buffer out;
    appendRow(out, m.row(index));
    return fmt::to_string(out);
}

std::string formatError(const MatrixError& err) {
    return fmt::format("densemat::MatrixError <{}>: {}", err.codeName(), err.what());
}

std::ostream& operator<<(std::ostream& os, const Matrix& m) {
    return os << m.toString();
}

}  // namespace densemat

#include "../source/densemat.hpp"
#include "fmt/core.h"

int main() {
    using namespace densemat;

    fmt::print("=== Dense Matrix Operations Demo ===\n\n");

    const Matrix a{{1, 3, 5}, {5, 7, 4}};
    const Matrix b{{6, 7, -5}, {-10, 5, 16}};

    fmt::print("A =\n{}\n\n", a);
    fmt::print("B =\n{}\n\n", b);
    fmt::print("A + B =\n{}\n\n", a + b);
    fmt::print("A - B =\n{}\n\n", a - b);
    fmt::print("2 * A =\n{}\n\n", 2.0 * a);

    const Matrix at = Matrix::transpose(a);
    fmt::print("A^T =\n{}\n\n", at);
    fmt::print("A * A^T =\n{}\n\n", a * at);

    const Matrix I = Matrix::identity(3);
    fmt::print("I(3) =\n{}\n", I);
    fmt::print("trace(I) = {}, diagonal: {}, sparse: {}\n\n", I.trace(), I.isDiagonal(), I.isSparse());

    // Row replacement through the select/change pair
    Matrix m = a.deepCopy();
    m.select(0).change({0, 0, 0});
    fmt::print("A with row 0 cleared =\n{}\n", m);
    fmt::print("Equal to A: {}\n\n", m == a);

    fmt::print("Uninitialized matrix renders as {}\n\n", Matrix{});

    // Errors carry their kind; this is where a caller would report them
    try {
        const auto bad = Matrix::mult(a, b);
        fmt::print("ERROR: Should have thrown exception! {}\n", bad);
    } catch (const MatrixError& err) {
        fmt::print(stderr, "error: {}\n", err);
    }

    try {
        Matrix fresh(2, 2);
        fresh.change(1.0);
    } catch (const MatrixError& err) {
        fmt::print(stderr, "error: {} [{}]\n", err, err.errnoString());
    }

    return 0;
}

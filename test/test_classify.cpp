#include "densemat.hpp"
#include "doctest/doctest.h"
#include "test_helpers.hpp"

using namespace densemat;

TEST_CASE("Square matrices") {
    CHECK(Matrix(3, 3).isSquare());
    CHECK_FALSE(Matrix(2, 3).isSquare());
    CHECK(Matrix::isSquare(Matrix::identity(4)));
    CHECK(Matrix::isSquare(Table{{1, 2}, {3, 4}}));
    CHECK(raisedCode([] { (void)Matrix().isSquare(); }) == ErrorCode::NullMatrix);
}

TEST_CASE("Diagonal matrices") {
    SUBCASE("Identity is diagonal") {
        for (Index n = 1; n <= 4; ++n) {
            const Matrix I = Matrix::identity(n);
            CHECK(I.isSquare());
            CHECK(I.isDiagonal());
        }
    }

    SUBCASE("Off-diagonal round-off is tolerated") {
        const Matrix m{{2, 1e-9}, {-1e-7, 3}};
        CHECK(m.isDiagonal());
        CHECK(Matrix::isDiagonal(m));
    }

    SUBCASE("Off-diagonal entries above the threshold") {
        const Matrix m{{2, 1e-5}, {0, 3}};
        CHECK_FALSE(m.isDiagonal());
        CHECK_FALSE(Matrix::isDiagonal(m.getEntries()));
    }

    SUBCASE("Requires a square matrix") {
        CHECK(raisedCode([] { (void)Matrix(2, 3).isDiagonal(); }) == ErrorCode::IllegalMatrixSize);
        CHECK(raisedCode([] { (void)Matrix().isDiagonal(); }) == ErrorCode::NullMatrix);
    }
}

TEST_CASE("Triangular matrices") {
    const Matrix lower{{1, 0, 0}, {2, 3, 0}, {4, 5, 6}};
    const Matrix upper{{1, 2, 3}, {0, 4, 5}, {0, 0, 6}};
    const Matrix full{{1, 2}, {3, 4}};

    CHECK(lower.isLowerTriangular());
    CHECK_FALSE(lower.isUpperTriangular());
    CHECK(upper.isUpperTriangular());
    CHECK_FALSE(upper.isLowerTriangular());
    CHECK_FALSE(full.isLowerTriangular());
    CHECK_FALSE(full.isUpperTriangular());

    // A diagonal matrix is both
    const Matrix I = Matrix::identity(3);
    CHECK(Matrix::isLowerTriangular(I));
    CHECK(Matrix::isUpperTriangular(I));

    CHECK(Matrix::isLowerTriangular(Table{{1, 1e-8}, {2, 3}}));
    CHECK(Matrix::isUpperTriangular(Table{{1, 2}, {-1e-8, 3}}));

    CHECK(raisedCode([] { (void)Matrix(3, 2).isLowerTriangular(); }) == ErrorCode::IllegalMatrixSize);
    CHECK(raisedCode([] { (void)Matrix(3, 2).isUpperTriangular(); }) == ErrorCode::IllegalMatrixSize);
    CHECK(raisedCode([] { (void)Matrix().isUpperTriangular(); }) == ErrorCode::NullMatrix);
}

TEST_CASE("Sparse matrices") {
    SUBCASE("Nonzero count against the larger dimension") {
        Matrix m(3, 4);
        m.select(0).change({1, 0, 0, 2});
        m.select(1).change({0, 3, 0, 0});
        m.select(2).change({0, 0, 4, 0});
        CHECK(m.isSparse());

        m.select(2).change({5, 0, 4, 0});
        CHECK_FALSE(m.isSparse());
    }

    SUBCASE("Values under the threshold do not count") {
        const Matrix m{{1, 1e-7, 1e-7}, {1e-7, 1, 1e-7}, {1e-7, 1e-7, 1}};
        CHECK(Matrix::isSparse(m));
    }

    SUBCASE("Zero and identity matrices are sparse") {
        CHECK(Matrix(5, 5).isSparse());
        CHECK(Matrix::identity(5).isSparse());
        CHECK_FALSE(Matrix(2, 2, 1.0).isSparse());
    }

    SUBCASE("Raw table and uninitialized") {
        CHECK(Matrix::isSparse(Table{{0, 1}, {0, 0}}));
        CHECK(raisedCode([] { (void)Matrix().isSparse(); }) == ErrorCode::NullMatrix);
        CHECK(raisedCode([] { (void)Matrix::isSparse(Table{}); }) == ErrorCode::NullMatrix);
    }
}

TEST_CASE("Identity matrices") {
    CHECK(Matrix::identity(4).isIdentity());
    CHECK(Matrix::isIdentity(Table{{1, 0}, {0, 1}}));
    CHECK(Matrix::isIdentity(Matrix{{1, 1e-9}, {0, 1}}));

    // Diagonal entries must be exactly one
    CHECK_FALSE(Matrix{{1, 0}, {0, 1.0000001}}.isIdentity());
    CHECK_FALSE(Matrix{{2, 0}, {0, 2}}.isIdentity());
    CHECK_FALSE(Matrix{{1, 1}, {0, 1}}.isIdentity());

    CHECK(raisedCode([] { (void)Matrix(1, 2).isIdentity(); }) == ErrorCode::IllegalMatrixSize);
    CHECK(raisedCode([] { (void)Matrix().isIdentity(); }) == ErrorCode::NullMatrix);
}

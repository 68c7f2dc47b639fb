#include "densemat.hpp"
#include "doctest/doctest.h"
#include "test_helpers.hpp"

using namespace densemat;

TEST_CASE("MatrixBuilder fills rows in order") {
    MatrixBuilder builder(3, 2);
    CHECK(builder.filledRows() == 0);
    CHECK_FALSE(builder.isFull());

    builder.add({1, 2}).add(Row{3, 4});
    CHECK(builder.filledRows() == 2);

    SUBCASE("Unfilled rows stay zero") {
        CHECK(builder.build() == Matrix{{1, 2}, {3, 4}, {0, 0}});
    }

    SUBCASE("Fill a row with one value") {
        builder.add(7.0);
        CHECK(builder.isFull());
        CHECK(builder.build() == Matrix{{1, 2}, {3, 4}, {7, 7}});
    }

    SUBCASE("Adding past the last row fails") {
        builder.add({5, 6});
        CHECK(raisedCode([&] { builder.add({7, 8}); }) == ErrorCode::MatrixFull);
        CHECK(raisedCode([&] { builder.add(1.0); }) == ErrorCode::MatrixFull);
        CHECK(builder.build() == Matrix{{1, 2}, {3, 4}, {5, 6}});
    }

    SUBCASE("Row length must match the column count") {
        CHECK(raisedCode([&] { builder.add({1, 2, 3}); }) == ErrorCode::IllegalMatrixSize);
        CHECK(raisedCode([&] { builder.add({1}); }) == ErrorCode::IllegalMatrixSize);
        CHECK(builder.filledRows() == 2);
    }
}

TEST_CASE("MatrixBuilder validates its size") {
    CHECK(raisedCode([] { MatrixBuilder b(0, 2); }) == ErrorCode::IllegalMatrixSize);
    CHECK(raisedCode([] { MatrixBuilder b(2, -1); }) == ErrorCode::IllegalMatrixSize);
}

TEST_CASE("Built matrices are independent of the builder") {
    MatrixBuilder builder(1, 2);
    builder.add({1, 2});
    Matrix first  = builder.build();
    Matrix second = builder.build();
    first.select(0).change(0.0);
    CHECK(second == Matrix{{1, 2}});
}

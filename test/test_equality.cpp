#include <unordered_set>

#include "densemat.hpp"
#include "doctest/doctest.h"

using namespace densemat;

TEST_CASE("Matrix equality") {
    SUBCASE("Same object") {
        const Matrix m{{1, 2}, {3, 4}};
        CHECK(m.equals(m));
        CHECK(m == m);
    }

    SUBCASE("Both uninitialized") {
        CHECK(Matrix().equals(Matrix()));
    }

    SUBCASE("Uninitialized against initialized") {
        CHECK_FALSE(Matrix().equals(Matrix(1, 1)));
        CHECK_FALSE(Matrix(1, 1).equals(Matrix()));
    }

    SUBCASE("Same values") {
        CHECK(Matrix{{1, 2}, {3, 4}} == Matrix(Table{{1, 2}, {3, 4}}));
        CHECK(Matrix(2, 2, 0.0) == Matrix(2, 2));
    }

    SUBCASE("Different shape with the same cell count") {
        CHECK(Matrix(2, 3) != Matrix(3, 2));
        CHECK(Matrix{{1, 2, 3, 4}} != Matrix{{1, 2}, {3, 4}});
    }

    SUBCASE("Comparison is exact, not threshold based") {
        const Matrix a{{1.0, 2.0}};
        const Matrix b{{1.0, 2.0 + 1e-9}};
        CHECK_FALSE(a.equals(b));
    }

    SUBCASE("Same shape, different values") {
        CHECK(Matrix(3, 3, 1.0) != Matrix(3, 3, 2.0));
    }
}

TEST_CASE("Matrix shape comparison") {
    CHECK(Matrix::shapeEquals(Matrix(2, 3), Matrix(2, 3, 7.0)));
    CHECK(Matrix(4, 1).shapeEquals(Matrix(4, 1, -1.0)));
    CHECK_FALSE(Matrix::shapeEquals(Matrix(2, 3), Matrix(3, 2)));

    // Unlike equals(), two uninitialized matrices do not share a shape
    CHECK_FALSE(Matrix::shapeEquals(Matrix(), Matrix()));
    CHECK_FALSE(Matrix::shapeEquals(Matrix(), Matrix(1, 1)));
    CHECK_FALSE(Matrix(1, 1).shapeEquals(Matrix()));
}

TEST_CASE("Matrix hashing") {
    SUBCASE("Equal matrices hash alike") {
        const Matrix a{{1, 2, 3}, {4, 5, 6}};
        const Matrix b = a.deepCopy();
        CHECK(a.hashCode() == b.hashCode());
        CHECK(std::hash<Matrix>{}(a) == std::hash<Matrix>{}(b));
        CHECK(Matrix().hashCode() == Matrix().hashCode());
    }

    SUBCASE("Signed zero") {
        const Matrix pos{{0.0, 1.0}};
        const Matrix neg{{-0.0, 1.0}};
        REQUIRE(pos == neg);
        CHECK(pos.hashCode() == neg.hashCode());
    }

    SUBCASE("Values participate in the hash") {
        CHECK(Matrix(2, 2, 1.0).hashCode() != Matrix(2, 2, 2.0).hashCode());
    }

    SUBCASE("Usable in unordered containers") {
        std::unordered_set<Matrix> set;
        set.insert(Matrix::identity(2));
        set.insert(Matrix{{1, 0}, {0, 1}});
        set.insert(Matrix(2, 2));
        CHECK(set.size() == 2);
        CHECK(set.count(Matrix::identity(2)) == 1);
    }
}

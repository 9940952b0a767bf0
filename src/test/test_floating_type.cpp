// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#include <catch2/catch_all.hpp>

#include <limits>

#include "dftypes.hpp"

using namespace dftypes;

static const float NaN = std::numeric_limits<float>::quiet_NaN();

TEST_CASE("float constants compare bitwise", "[float]") {
    REQUIRE(float_value(1.0f) == float_value(1.0f));
    REQUIRE(float_value(0.0f) != float_value(-0.0f));
    REQUIRE(float_value(NaN) == float_value(NaN));
    REQUIRE(float_value(NaN) == float_value(-NaN));
    REQUIRE(float_value(0.0f) != float_zero());
    REQUIRE(constant_of<float>(float_value(2.5f)) == 2.5f);
    REQUIRE_FALSE(constant_of<float>(float_zero()));
}

TEST_CASE("signed zero bucket", "[float][zero]") {
    const DfType plus_zero = float_value(0.0f);
    const DfType minus_zero = float_value(-0.0f);

    REQUIRE(float_zero().is_super_type(plus_zero));
    REQUIRE(float_zero().is_super_type(minus_zero));
    REQUIRE_FALSE(float_zero().is_super_type(float_value(1.0f)));
    REQUIRE_FALSE(plus_zero.is_super_type(float_zero()));

    const DfType not_zero = float_zero().try_negate();
    REQUIRE(not_zero == float_not_values({0.0f, -0.0f}));
    REQUIRE(not_zero.is_super_type(float_value(1.0f)));
    REQUIRE(not_zero.is_super_type(float_value(NaN)));
    REQUIRE_FALSE(not_zero.is_super_type(plus_zero));
    REQUIRE_FALSE(not_zero.is_super_type(minus_zero));
    REQUIRE(not_zero.try_negate() == float_zero());

    SECTION("join") {
        REQUIRE(plus_zero.join(minus_zero) == float_zero());
        REQUIRE(float_zero().join(plus_zero) == float_zero());
        REQUIRE(float_zero().join(float_value(1.0f)) == float_type());
        REQUIRE(float_value(1.0f).join(float_zero()) == float_type());
        REQUIRE(float_zero().join(float_not_values({0.0f, 1.0f})) == float_not_values({1.0f}));
        REQUIRE(float_not_values({0.0f, 1.0f}).join(float_zero()) == float_not_values({1.0f}));
        REQUIRE(float_zero().join(float_not_values({0.0f, -0.0f})) == float_type());
    }

    SECTION("meet") {
        REQUIRE(float_zero().meet(minus_zero) == minus_zero);
        REQUIRE(float_zero().meet(float_value(1.0f)).is_bottom());
        REQUIRE(float_zero().meet(float_not_values({0.0f})) == minus_zero);
        REQUIRE(float_not_values({-0.0f}).meet(float_zero()) == plus_zero);
        REQUIRE(float_zero().meet(not_zero).is_bottom());
        REQUIRE(float_zero().meet(float_not_values({1.0f})) == float_zero());
    }
}

TEST_CASE("float not-values", "[float]") {
    SECTION("construction") {
        REQUIRE(float_not_values({}) == float_type());
        REQUIRE(float_not_values({1.0f, 2.0f}) == float_not_values({2.0f, 1.0f}));
        REQUIRE(float_not_values({NaN}).is_super_type(float_value(1.0f)));
        REQUIRE_FALSE(float_not_values({NaN}).is_super_type(float_value(NaN)));
    }

    SECTION("subsumption") {
        REQUIRE(float_type().is_super_type(float_not_values({1.0f})));
        REQUIRE(float_not_values({1.0f}).is_super_type(float_not_values({1.0f, 2.0f})));
        REQUIRE_FALSE(float_not_values({1.0f, 2.0f}).is_super_type(float_not_values({1.0f})));
        REQUIRE(float_not_values({1.0f}).is_super_type(float_value(2.0f)));
        REQUIRE_FALSE(float_not_values({1.0f}).is_super_type(float_value(1.0f)));
        REQUIRE_FALSE(float_not_values({1.0f}).is_super_type(float_type()));
    }

    SECTION("join") {
        REQUIRE(float_not_values({1.0f}).join(float_value(1.0f)) == float_type());
        REQUIRE(float_not_values({1.0f, 2.0f}).join(float_value(1.0f)) == float_not_values({2.0f}));
        REQUIRE(float_not_values({1.0f}).join(float_value(2.0f)) == float_not_values({1.0f}));
        REQUIRE(float_not_values({1.0f, 2.0f}).join(float_not_values({2.0f, 3.0f})) == float_not_values({2.0f}));
        REQUIRE(float_not_values({1.0f}).join(float_not_values({2.0f})) == float_type());
    }

    SECTION("meet") {
        REQUIRE(float_not_values({1.0f}).meet(float_value(1.0f)).is_bottom());
        REQUIRE(float_not_values({1.0f}).meet(float_value(2.0f)) == float_value(2.0f));
        REQUIRE(float_not_values({1.0f}).meet(float_not_values({2.0f})) == float_not_values({1.0f, 2.0f}));
        REQUIRE(float_type().meet(float_not_values({1.0f})) == float_not_values({1.0f}));
    }
}

TEST_CASE("float constants", "[float]") {
    REQUIRE(float_value(1.0f).join(float_value(2.0f)) == float_type());
    REQUIRE(float_value(1.0f).meet(float_value(2.0f)).is_bottom());
    REQUIRE(float_value(1.0f).join(float_value(1.0f)) == float_value(1.0f));
    REQUIRE(float_type().is_super_type(float_value(NaN)));
}

TEST_CASE("float negation", "[float][negate]") {
    REQUIRE(float_value(1.0f).try_negate() == float_not_values({1.0f}));
    REQUIRE(float_not_values({1.0f}).try_negate() == float_value(1.0f));
    REQUIRE(float_not_values({1.0f, 2.0f}).try_negate().is_bottom());
    REQUIRE(float_type().try_negate().is_bottom());
    REQUIRE(float_value(NaN).try_negate().try_negate() == float_value(NaN));
}

TEST_CASE("double domain", "[double]") {
    REQUIRE(double_zero().is_super_type(double_value(-0.0)));
    REQUIRE(double_value(0.0).join(double_value(-0.0)) == double_zero());
    REQUIRE(double_zero().try_negate() == double_not_values({0.0, -0.0}));
    REQUIRE(double_value(3.0).try_negate() == double_not_values({3.0}));
    REQUIRE(double_not_values({3.0}).meet(double_value(4.0)) == double_value(4.0));
    REQUIRE(double_value(1.0).join(float_value(1.0f)).is_top());
    REQUIRE(double_value(1.0).meet(float_value(1.0f)).is_bottom());
    REQUIRE(constant_of<double>(double_value(0.5)) == 0.5);
}

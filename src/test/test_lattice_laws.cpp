// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#include <catch2/catch_all.hpp>

#include <limits>
#include <vector>

#include "dftypes.hpp"
#include "test/test_hierarchy.hpp"

using namespace dftypes;

// A sample of every family, with constants, ranges and special cases.
static std::vector<DfType> sample_types() {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    return {
        top_type(),
        bottom_type(),
        boolean_type(),
        true_type(),
        false_type(),
        int_type(),
        int_value(0),
        int_value(5),
        int_range(RangeSet::range(0, 10)),
        int_range(RangeSet::of({Interval{0, 10}, Interval{20, 30}})),
        int_range(RangeSet::range(0, 10), RangeSet::range(-100, 100)),
        int_value(0).try_negate(),
        long_type(),
        long_value(5),
        long_range(RangeSet::range(-1, 1)),
        float_type(),
        float_zero(),
        float_value(0.0f),
        float_value(-0.0f),
        float_value(1.0f),
        float_value(nan),
        float_not_values({1.0f}),
        float_not_values({0.0f}),
        float_not_values({0.0f, -0.0f}),
        float_not_values({1.0f, 2.0f}),
        double_type(),
        double_zero(),
        double_value(1.0),
        null_type(),
        not_null_object(),
        object_or_null(),
        local_object(),
        custom_object(TypeConstraint::top(), Nullability::nullable, Mutability::unknown, {}, top_type()),
        typed_object(class_type("Number"), DeclaredNullability::nullable),
        typed_object(class_type("String"), DeclaredNullability::nullable),
        typed_object(class_type("Number"), DeclaredNullability::not_null),
        typed_object(class_type("Integer"), DeclaredNullability::unknown),
        typed_object(class_type("Comparable"), DeclaredNullability::unknown),
        typed_object(class_type("Thread"), DeclaredNullability::not_null),
        constant(std::string{"ab"}, class_type("String")),
        constant(std::string{"cd"}, class_type("String")),
        concatenation_result("ab"),
        reference_constant(int32_t{1}, class_type("Integer")),
        custom_object(TypeConstraint::top(), Nullability::not_null, Mutability::unmodifiable,
                      SpecialField::array_length, int_range(RangeSet::range(0, 10))),
        custom_object(TypeConstraint::top(), Nullability::not_null, Mutability::unknown, SpecialField::array_length,
                      int_value(3)),
    };
}

TEST_CASE("join and meet are idempotent", "[lattice]") {
    ThreadLocalGuard guard;
    install_test_hierarchy();
    for (const DfType& a : sample_types()) {
        INFO(a);
        REQUIRE(a.join(a) == a);
        REQUIRE(a.meet(a) == a);
        REQUIRE(a.is_super_type(a));
    }
}

TEST_CASE("top and bottom bound every element", "[lattice]") {
    ThreadLocalGuard guard;
    install_test_hierarchy();
    for (const DfType& a : sample_types()) {
        INFO(a);
        REQUIRE(a.meet(bottom_type()) == bottom_type());
        REQUIRE(a.join(top_type()) == top_type());
        REQUIRE(a.join(bottom_type()) == a);
        REQUIRE(a.meet(top_type()) == a);
        REQUIRE(top_type().is_super_type(a));
        REQUIRE(a.is_super_type(bottom_type()));
    }
}

TEST_CASE("join and meet are commutative bounds", "[lattice]") {
    ThreadLocalGuard guard;
    install_test_hierarchy();
    const auto types = sample_types();
    for (const DfType& a : types) {
        for (const DfType& b : types) {
            INFO(a << " and " << b);
            const DfType j = a.join(b);
            const DfType m = a.meet(b);
            REQUIRE(j == b.join(a));
            REQUIRE(m == b.meet(a));
            REQUIRE(j.is_super_type(a));
            REQUIRE(j.is_super_type(b));
            // A not-null value satisfies a nullable declaration, although the two are incomparable.
            const bool narrowed_to_not_null = nullability_of(m) == Nullability::not_null;
            if (!narrowed_to_not_null || nullability_of(a) != Nullability::nullable) {
                REQUIRE(a.is_super_type(m));
            }
            if (!narrowed_to_not_null || nullability_of(b) != Nullability::nullable) {
                REQUIRE(b.is_super_type(m));
            }
        }
    }
}

TEST_CASE("meeting a nullable reference with a not-null one is not-null", "[lattice]") {
    ThreadLocalGuard guard;
    install_test_hierarchy();
    const DfType nullable_number = typed_object(class_type("Number"), DeclaredNullability::nullable);
    const DfType number = typed_object(class_type("Number"), DeclaredNullability::not_null);
    REQUIRE(nullable_number.meet(number) == number);
    REQUIRE(number.meet(nullable_number) == number);
    REQUIRE_FALSE(nullable_number.is_super_type(number));
    REQUIRE_FALSE(number.is_super_type(nullable_number));
    REQUIRE(nullable_number.join(number) == typed_object(class_type("Number"), DeclaredNullability::unknown));
}

TEST_CASE("subsumption is antisymmetric", "[lattice]") {
    ThreadLocalGuard guard;
    install_test_hierarchy();
    const auto types = sample_types();
    for (const DfType& a : types) {
        for (const DfType& b : types) {
            INFO(a << " and " << b);
            if (a.is_super_type(b) && b.is_super_type(a)) {
                REQUIRE(a == b);
            }
            if (a == b) {
                REQUIRE(std::hash<DfType>{}(a) == std::hash<DfType>{}(b));
            }
        }
    }
}

TEST_CASE("subsumption agrees with join and meet", "[lattice]") {
    ThreadLocalGuard guard;
    install_test_hierarchy();
    const auto types = sample_types();
    for (const DfType& a : types) {
        for (const DfType& b : types) {
            INFO(a << " and " << b);
            if (a.is_super_type(b)) {
                REQUIRE(a.join(b) == a);
                REQUIRE(a.meet(b) == b);
            }
        }
    }
}

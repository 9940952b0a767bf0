// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#include <catch2/catch_all.hpp>

#include <sstream>

#include "dftypes.hpp"
#include "test/test_hierarchy.hpp"

using namespace dftypes;

static std::string str(const DfType& t) {
    std::ostringstream s;
    s << t;
    return s.str();
}

TEST_CASE("print primitive types", "[print]") {
    REQUIRE(str(top_type()) == "TOP");
    REQUIRE(str(bottom_type()) == "BOTTOM");
    REQUIRE(str(boolean_type()) == "boolean");
    REQUIRE(str(true_type()) == "true");
    REQUIRE(str(int_type()) == "int");
    REQUIRE(str(int_value(5)) == "5");
    REQUIRE(str(int_value(-5)) == "-5");
    REQUIRE(str(int_range(RangeSet::range(0, 10))) == "int {0..10}");
    REQUIRE(str(int_value(0).join(int_value(2))) == "int {0, 2}");
    REQUIRE(str(long_type()) == "long");
    REQUIRE(str(long_value(5)) == "5L");
    REQUIRE(str(long_range(RangeSet::range(1, 3))) == "long {1..3}");
}

TEST_CASE("print floating point types", "[print]") {
    REQUIRE(str(float_type()) == "float");
    REQUIRE(str(float_value(1.5f)) == "1.5f");
    REQUIRE(str(float_value(0.0f)) == "0.0f");
    REQUIRE(str(float_value(-0.0f)) == "-0.0f");
    REQUIRE(str(float_zero()) == "float 0.0 or -0.0");
    REQUIRE(str(float_zero().try_negate()) == "float != 0.0, -0.0");
    REQUIRE(str(double_type()) == "double");
    REQUIRE(str(double_value(2.0)) == "2.0");
    REQUIRE(str(double_not_values({3.0})) == "double != 3.0");
}

TEST_CASE("print reference types", "[print]") {
    ThreadLocalGuard guard;
    install_test_hierarchy();

    REQUIRE(str(null_type()) == "null");
    REQUIRE(str(object_or_null()) == "Object");
    REQUIRE(str(not_null_object()) == "!null");
    REQUIRE(str(local_object()) == "!null local object");
    REQUIRE(str(typed_object(class_type("String"), DeclaredNullability::not_null)) == "!null instanceof String");
    REQUIRE(str(typed_object(class_type("Number"), DeclaredNullability::nullable)) == "nullable instanceof Number");
    REQUIRE(str(concatenation_result("x").widen()) == "!null exactly String length()=1");
    REQUIRE(str(custom_object(TypeConstraint::top(), Nullability::not_null, Mutability::modifiable,
                              SpecialField::array_length, int_range(RangeSet::range(0, 10)))) ==
            "!null modifiable length=int {0..10}");

    REQUIRE(str(constant(std::string{"ab"}, class_type("String"))) == "\"ab\"");
    REQUIRE(str(constant(EnumMember{"Color", "RED"}, class_type("Color"))) == "Color.RED");
    REQUIRE(str(constant(TypeLiteral{"Integer"}, class_type("Class"))) == "Integer.class");
    REQUIRE(str(reference_constant(int32_t{42}, class_type("Integer"))) == "42");
    REQUIRE(int_value(5).to_string() == "5");
}

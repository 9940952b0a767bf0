// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#include <catch2/catch_all.hpp>

#include <iostream>
#include <set>
#include <sstream>

#include "dftypes.hpp"
#include "test/test_hierarchy.hpp"
#include "utils/debug.hpp"

using namespace dftypes;

TEST_CASE("type hierarchy subtyping", "[hierarchy]") {
    ThreadLocalGuard guard;
    install_test_hierarchy();
    const TypeHierarchy& h = *thread_local_type_hierarchy;

    REQUIRE(h.is_subtype("Integer", "Integer"));
    REQUIRE(h.is_subtype("Integer", "Number"));
    REQUIRE(h.is_subtype("Integer", "Comparable"));
    REQUIRE(h.is_subtype("Integer", "Object"));
    REQUIRE(h.is_subtype("ArrayList", "Collection"));
    REQUIRE_FALSE(h.is_subtype("Number", "Integer"));
    REQUIRE_FALSE(h.is_subtype("Object", "Number"));
    REQUIRE_FALSE(h.is_subtype("Thread", "Number"));

    // Undeclared types only have the root above them.
    REQUIRE(h.is_subtype("Unknown", "Object"));
    REQUIRE_FALSE(h.is_subtype("Unknown", "Number"));

    REQUIRE(h.ancestors("ArrayList") ==
            std::set<std::string>{"ArrayList", "AbstractList", "List", "Collection", "Object"});
    REQUIRE(h.is_final("String"));
    REQUIRE_FALSE(h.is_final("Number"));
}

TEST_CASE("extending a final type warns", "[hierarchy]") {
    TypeHierarchy h;
    DfTypesEnableWarningMsg(true);
    std::ostringstream captured;
    std::streambuf* old = std::cerr.rdbuf(captured.rdbuf());
    h.declare("Color", {.is_final = true});
    h.declare("Shade", {.supertypes = {"Color"}});
    std::cerr.rdbuf(old);
    DfTypesEnableWarningMsg(false);

    REQUIRE(captured.str().find("Shade declared as a subtype of final type Color") != std::string::npos);
    REQUIRE(h.is_subtype("Shade", "Color"));
}

TEST_CASE("type hierarchy intersection", "[hierarchy]") {
    ThreadLocalGuard guard;
    install_test_hierarchy();
    const TypeHierarchy& h = *thread_local_type_hierarchy;

    REQUIRE(h.may_intersect("Number", "Integer"));
    REQUIRE(h.may_intersect("Number", "Comparable"));
    REQUIRE_FALSE(h.may_intersect("Number", "Thread"));
    REQUIRE_FALSE(h.may_intersect("String", "Collection"));
    REQUIRE(h.may_intersect("Thread", "Collection"));
}

TEST_CASE("type constraint construction", "[constraint]") {
    ThreadLocalGuard guard;
    install_test_hierarchy();

    REQUIRE(TypeConstraint::instance_of("Object") == TypeConstraint::top());
    REQUIRE(TypeConstraint::instance_of("Number").kind() == TypeConstraint::Kind::bounded);
    REQUIRE(TypeConstraint::exact("Number").exact_type() == "Number");
    REQUIRE_FALSE(TypeConstraint::instance_of("Number").exact_type());

    SECTION("redundant bounds are dropped") {
        REQUIRE(TypeConstraint::instance_of_all({"Number", "Integer"}) == TypeConstraint::instance_of("Integer"));
        REQUIRE(TypeConstraint::instance_of_all({"Object", "Number"}) == TypeConstraint::instance_of("Number"));
        REQUIRE(TypeConstraint::instance_of_all({}) == TypeConstraint::top());
    }

    SECTION("unrelated classes") {
        REQUIRE(TypeConstraint::instance_of_all({"Number", "Thread"}).is_bottom());
    }

    SECTION("class and interface") {
        const auto c = TypeConstraint::instance_of_all({"Number", "Comparable"});
        REQUIRE(c.types().size() == 2);
        REQUIRE(c.implies("Number"));
        REQUIRE(c.implies("Comparable"));
        REQUIRE_FALSE(c.implies("Integer"));
    }
}

TEST_CASE("type constraint subsumption", "[constraint]") {
    ThreadLocalGuard guard;
    install_test_hierarchy();
    const auto number = TypeConstraint::instance_of("Number");
    const auto integer = TypeConstraint::instance_of("Integer");
    const auto exact_number = TypeConstraint::exact("Number");

    REQUIRE(number.is_super_constraint(integer));
    REQUIRE_FALSE(integer.is_super_constraint(number));
    REQUIRE(number.is_super_constraint(exact_number));
    REQUIRE_FALSE(exact_number.is_super_constraint(number));
    REQUIRE_FALSE(exact_number.is_super_constraint(integer));
    REQUIRE(TypeConstraint::top().is_super_constraint(exact_number));
    REQUIRE(exact_number.is_super_constraint(TypeConstraint::bottom()));
}

TEST_CASE("type constraint join", "[constraint][join]") {
    ThreadLocalGuard guard;
    install_test_hierarchy();
    const auto integer = TypeConstraint::instance_of("Integer");

    REQUIRE(integer.join(TypeConstraint::instance_of("Number")) == TypeConstraint::instance_of("Number"));
    REQUIRE(integer.join(TypeConstraint::instance_of("Long")) ==
            TypeConstraint::instance_of_all({"Number", "Comparable"}));
    REQUIRE(integer.join(TypeConstraint::exact("String")) == TypeConstraint::instance_of("Comparable"));
    REQUIRE(integer.join(TypeConstraint::instance_of("Thread")) == TypeConstraint::top());
    REQUIRE(TypeConstraint::exact("Integer").join(TypeConstraint::exact("Integer")) ==
            TypeConstraint::exact("Integer"));
    REQUIRE(TypeConstraint::exact("Integer").join(TypeConstraint::exact("Long")) ==
            TypeConstraint::instance_of_all({"Number", "Comparable"}));

    SECTION("joins are logged under the constraint tag") {
        DfTypesEnableLog("constraint");
        std::ostringstream captured;
        std::streambuf* old = std::cout.rdbuf(captured.rdbuf());
        const TypeConstraint joined = integer.join(TypeConstraint::instance_of("Thread"));
        std::cout.rdbuf(old);
        DfTypesLogFlag = false;
        DfTypesLog.clear();

        REQUIRE(joined == TypeConstraint::top());
        REQUIRE(captured.str().find("join ") != std::string::npos);
    }
}

TEST_CASE("type constraint meet", "[constraint][meet]") {
    ThreadLocalGuard guard;
    install_test_hierarchy();
    const auto number = TypeConstraint::instance_of("Number");

    REQUIRE(number.meet(TypeConstraint::instance_of("Integer")) == TypeConstraint::instance_of("Integer"));
    REQUIRE(number.meet(TypeConstraint::instance_of("Thread")).is_bottom());
    REQUIRE(TypeConstraint::instance_of("String").meet(TypeConstraint::instance_of("Collection")).is_bottom());
    REQUIRE(number.meet(TypeConstraint::exact("Number")) == TypeConstraint::exact("Number"));
    REQUIRE(TypeConstraint::exact("Number").meet(TypeConstraint::instance_of("Integer")).is_bottom());
    REQUIRE(number.meet(TypeConstraint::instance_of("Comparable")) ==
            TypeConstraint::instance_of("Comparable").meet(number));
}

TEST_CASE("type constraint printing", "[constraint][print]") {
    ThreadLocalGuard guard;
    install_test_hierarchy();

    auto str = [](const TypeConstraint& c) {
        std::ostringstream s;
        s << c;
        return s.str();
    };
    REQUIRE(str(TypeConstraint::top()).empty());
    REQUIRE(str(TypeConstraint::bottom()) == "_|_");
    REQUIRE(str(TypeConstraint::exact("String")) == "exactly String");
    REQUIRE(str(TypeConstraint::instance_of_all({"Number", "Comparable"})) == "instanceof Comparable, Number");
}

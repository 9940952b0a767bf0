// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#include <algorithm>
#include <ostream>

#include <boost/container_hash/hash.hpp>

#include "types/type_constraint.hpp"
#include "types/type_hierarchy.hpp"
#include "utils/antichain.hpp"
#include "utils/debug.hpp"

namespace dftypes {

// Keep only the most specific bounds: a bound implied by another one is redundant.
static boost::container::flat_set<std::string> minimize(boost::container::flat_set<std::string> bounds) {
    const TypeHierarchy& hierarchy = *thread_local_type_hierarchy;
    bounds.erase(hierarchy.root());
    upwards_antichain(bounds, [&](const std::string& general, const std::string& specific) {
        return hierarchy.is_subtype(specific, general);
    });
    return bounds;
}

TypeConstraint TypeConstraint::exact(const std::string& type) { return TypeConstraint{Kind::exact, {type}}; }

TypeConstraint TypeConstraint::instance_of(const std::string& type) {
    if (type == thread_local_type_hierarchy->root()) {
        return top();
    }
    return TypeConstraint{Kind::bounded, {type}};
}

TypeConstraint TypeConstraint::instance_of_all(const std::vector<std::string>& types) {
    TypeConstraint res = top();
    for (const std::string& type : types) {
        res = res.meet(instance_of(type));
    }
    return res;
}

std::optional<std::string> TypeConstraint::exact_type() const {
    if (_kind != Kind::exact) {
        return {};
    }
    return *_types.begin();
}

bool TypeConstraint::implies(const std::string& type) const {
    const TypeHierarchy& hierarchy = *thread_local_type_hierarchy;
    switch (_kind) {
    case Kind::top: return type == hierarchy.root();
    case Kind::bottom: return true;
    case Kind::exact:
    case Kind::bounded:
        return std::any_of(_types.begin(), _types.end(),
                           [&](const std::string& t) { return hierarchy.is_subtype(t, type); });
    }
    return false;
}

bool TypeConstraint::is_super_constraint(const TypeConstraint& other) const {
    if (other.is_bottom() || is_top()) {
        return true;
    }
    if (is_bottom() || other.is_top()) {
        return false;
    }
    if (_kind == Kind::exact) {
        return other == *this;
    }
    return std::all_of(_types.begin(), _types.end(), [&](const std::string& bound) { return other.implies(bound); });
}

TypeConstraint TypeConstraint::join(const TypeConstraint& other) const {
    if (is_super_constraint(other)) {
        return *this;
    }
    if (other.is_super_constraint(*this)) {
        return other;
    }
    // Candidates are the supertypes of our own types; keep those the other side also implies.
    const TypeHierarchy& hierarchy = *thread_local_type_hierarchy;
    boost::container::flat_set<std::string> common;
    for (const std::string& type : _types) {
        for (const std::string& ancestor : hierarchy.ancestors(type)) {
            if (other.implies(ancestor)) {
                common.insert(ancestor);
            }
        }
    }
    auto bounds = minimize(std::move(common));
    const TypeConstraint res = bounds.empty() ? top() : TypeConstraint{Kind::bounded, std::move(bounds)};
    DFTYPES_LOG("constraint", std::cout << "join " << *this << " | " << other << " = " << res << "\n");
    return res;
}

TypeConstraint TypeConstraint::meet(const TypeConstraint& other) const {
    if (is_super_constraint(other)) {
        return other;
    }
    if (other.is_super_constraint(*this)) {
        return *this;
    }
    // An exact type that does not satisfy the other side is a contradiction.
    if (_kind == Kind::exact || other._kind == Kind::exact) {
        DFTYPES_LOG("constraint", std::cout << "meet " << *this << " & " << other << " = _|_\n");
        return bottom();
    }
    const TypeHierarchy& hierarchy = *thread_local_type_hierarchy;
    boost::container::flat_set<std::string> bounds = _types;
    bounds.insert(other._types.begin(), other._types.end());
    for (const std::string& a : bounds) {
        for (const std::string& b : bounds) {
            if (!hierarchy.may_intersect(a, b)) {
                DFTYPES_LOG("constraint", std::cout << "meet " << *this << " & " << other << " = _|_\n");
                return bottom();
            }
        }
    }
    bounds = minimize(std::move(bounds));
    if (bounds.empty()) {
        return top();
    }
    return TypeConstraint{Kind::bounded, std::move(bounds)};
}

std::size_t hash_value(const TypeConstraint& c) {
    std::size_t seed = static_cast<std::size_t>(c._kind);
    boost::hash_range(seed, c._types.begin(), c._types.end());
    return seed;
}

std::ostream& operator<<(std::ostream& o, const TypeConstraint& c) {
    switch (c._kind) {
    case TypeConstraint::Kind::top: return o;
    case TypeConstraint::Kind::bottom: return o << "_|_";
    case TypeConstraint::Kind::exact: return o << "exactly " << *c._types.begin();
    case TypeConstraint::Kind::bounded: {
        o << "instanceof ";
        bool first = true;
        for (const std::string& t : c._types) {
            if (!first) {
                o << ", ";
            }
            first = false;
            o << t;
        }
        return o;
    }
    }
    return o;
}

} // namespace dftypes

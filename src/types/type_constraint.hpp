// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <optional>
#include <string>
#include <vector>

#include <boost/container/flat_set.hpp>

namespace dftypes {

/// A nominal bound on the runtime class of a reference.
///
/// - top: any class.
/// - exact: exactly the given class, no subclass.
/// - bounded: an instance of every class in a minimal set of bounds.
/// - bottom: no class satisfies the constraint.
///
/// Subtyping questions are answered by the thread's TypeHierarchy.
class TypeConstraint final {
  public:
    enum class Kind { top, exact, bounded, bottom };

  private:
    Kind _kind;
    boost::container::flat_set<std::string> _types;

    TypeConstraint(const Kind kind, boost::container::flat_set<std::string> types)
        : _kind(kind), _types(std::move(types)) {}

  public:
    static TypeConstraint top() { return TypeConstraint{Kind::top, {}}; }
    static TypeConstraint bottom() { return TypeConstraint{Kind::bottom, {}}; }
    static TypeConstraint exact(const std::string& type);
    static TypeConstraint instance_of(const std::string& type);
    static TypeConstraint instance_of_all(const std::vector<std::string>& types);

    [[nodiscard]]
    Kind kind() const {
        return _kind;
    }

    [[nodiscard]]
    bool is_top() const {
        return _kind == Kind::top;
    }

    [[nodiscard]]
    bool is_bottom() const {
        return _kind == Kind::bottom;
    }

    [[nodiscard]]
    std::optional<std::string> exact_type() const;

    [[nodiscard]]
    const boost::container::flat_set<std::string>& types() const {
        return _types;
    }

    // True if every object satisfying this constraint is an instance of `type`.
    [[nodiscard]]
    bool implies(const std::string& type) const;

    // True if every object satisfying `other` also satisfies this constraint.
    [[nodiscard]]
    bool is_super_constraint(const TypeConstraint& other) const;

    [[nodiscard]]
    TypeConstraint join(const TypeConstraint& other) const;

    [[nodiscard]]
    TypeConstraint meet(const TypeConstraint& other) const;

    bool operator==(const TypeConstraint& other) const = default;

    friend std::size_t hash_value(const TypeConstraint& c);

    friend std::ostream& operator<<(std::ostream& o, const TypeConstraint& c);
};

} // namespace dftypes

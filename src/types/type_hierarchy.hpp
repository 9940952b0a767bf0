// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "utils/lazy_allocator.hpp"

namespace dftypes {

struct TypeInfo {
    std::vector<std::string> supertypes; ///< direct supertypes, the root is implied
    bool is_final{};
    bool is_interface{};
};

/// Nominal subtyping oracle: a Hasse diagram of declared types given by their direct supertypes.
/// Types that were never declared behave like non-final classes whose only supertype is the root.
class TypeHierarchy final {
    std::map<std::string, TypeInfo> _types;
    std::string _root;
    std::string _string;

  public:
    explicit TypeHierarchy(std::string root = "Object", std::string string_type = "String");

    // Declare a type. Redeclaring a type replaces its previous declaration.
    void declare(const std::string& name, TypeInfo info);

    [[nodiscard]]
    const std::string& root() const {
        return _root;
    }

    [[nodiscard]]
    const std::string& string_type() const {
        return _string;
    }

    [[nodiscard]]
    bool is_final(const std::string& name) const;

    [[nodiscard]]
    bool is_interface(const std::string& name) const;

    // Reflexive, transitive. The root is a supertype of everything.
    [[nodiscard]]
    bool is_subtype(const std::string& sub, const std::string& super) const;

    // All supertypes of a type, including itself and the root.
    [[nodiscard]]
    std::set<std::string> ancestors(const std::string& name) const;

    // False only when no object can be an instance of both types.
    [[nodiscard]]
    bool may_intersect(const std::string& a, const std::string& b) const;
};

// The hierarchy consulted by TypeConstraint operations on the current thread.
extern thread_local LazyAllocator<TypeHierarchy> thread_local_type_hierarchy;

} // namespace dftypes

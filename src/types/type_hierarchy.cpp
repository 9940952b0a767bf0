// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#include <utility>

#include "types/type_hierarchy.hpp"
#include "utils/debug.hpp"

namespace dftypes {

thread_local LazyAllocator<TypeHierarchy> thread_local_type_hierarchy;

TypeHierarchy::TypeHierarchy(std::string root, std::string string_type)
    : _root(std::move(root)), _string(std::move(string_type)) {
    _types[_root] = TypeInfo{};
    _types[_string] = TypeInfo{.supertypes = {}, .is_final = true, .is_interface = false};
}

void TypeHierarchy::declare(const std::string& name, TypeInfo info) {
    for (const std::string& super : info.supertypes) {
        if (is_final(super)) {
            DFTYPES_WARN("type ", name, " declared as a subtype of final type ", super);
        }
    }
    _types[name] = std::move(info);
}

bool TypeHierarchy::is_final(const std::string& name) const {
    const auto it = _types.find(name);
    return it != _types.end() && it->second.is_final;
}

bool TypeHierarchy::is_interface(const std::string& name) const {
    const auto it = _types.find(name);
    return it != _types.end() && it->second.is_interface;
}

std::set<std::string> TypeHierarchy::ancestors(const std::string& name) const {
    std::set<std::string> ancestors{name, _root};
    std::vector<std::string> worklist{name};

    size_t head = 0;
    while (head < worklist.size()) {
        const std::string current = worklist[head++];
        const auto it = _types.find(current);
        if (it == _types.end()) {
            continue;
        }
        for (const std::string& parent : it->second.supertypes) {
            if (!ancestors.contains(parent)) { // if not visited
                ancestors.insert(parent);
                worklist.push_back(parent);
            }
        }
    }
    return ancestors;
}

bool TypeHierarchy::is_subtype(const std::string& sub, const std::string& super) const {
    if (sub == super || super == _root) {
        return true;
    }
    if (sub == _root) {
        return false;
    }
    return ancestors(sub).contains(super);
}

bool TypeHierarchy::may_intersect(const std::string& a, const std::string& b) const {
    if (is_subtype(a, b) || is_subtype(b, a)) {
        return true;
    }
    if (is_final(a) || is_final(b)) {
        return false;
    }
    // Single inheritance: two unrelated classes have no common instance.
    return is_interface(a) || is_interface(b);
}

} // namespace dftypes

// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#include <ostream>

#include <boost/container_hash/hash.hpp>

#include "arith/float_bits.hpp"
#include "types/host.hpp"

namespace dftypes {

struct SameConstantVisitor {
    template <typename T>
    bool operator()(const T& a, const T& b) const {
        if constexpr (std::is_floating_point_v<T>) {
            return same_bits(a, b);
        } else {
            return a == b;
        }
    }

    template <typename T, typename U>
    bool operator()(const T&, const U&) const {
        return false;
    }
};

bool same_constant(const ConstantObject& a, const ConstantObject& b) { return std::visit(SameConstantVisitor{}, a, b); }

std::size_t hash_value(const ConstantObject& c) {
    std::size_t seed = c.index();
    std::visit(
        [&seed](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_floating_point_v<T>) {
                boost::hash_combine(seed, canonical_bits(v));
            } else if constexpr (std::is_same_v<T, EnumMember>) {
                boost::hash_combine(seed, v.enum_type);
                boost::hash_combine(seed, v.name);
            } else if constexpr (std::is_same_v<T, DeclaredField>) {
                boost::hash_combine(seed, v.owner);
                boost::hash_combine(seed, v.name);
            } else if constexpr (std::is_same_v<T, TypeLiteral>) {
                boost::hash_combine(seed, v.type);
            } else {
                boost::hash_combine(seed, v);
            }
        },
        c);
    return seed;
}

std::ostream& operator<<(std::ostream& o, const ConstantObject& c) {
    struct Printer {
        std::ostream& o;
        void operator()(const bool v) const { o << (v ? "true" : "false"); }
        void operator()(const int32_t v) const { o << v; }
        void operator()(const int64_t v) const { o << v << "L"; }
        void operator()(const float v) const { o << v << "f"; }
        void operator()(const double v) const { o << v; }
        void operator()(const std::string& v) const { o << '"' << v << '"'; }
        void operator()(const EnumMember& v) const { o << v.enum_type << "." << v.name; }
        void operator()(const DeclaredField& v) const { o << v.owner << "." << v.name; }
        void operator()(const TypeLiteral& v) const { o << v.type << ".class"; }
    };
    std::visit(Printer{o}, c);
    return o;
}

std::ostream& operator<<(std::ostream& o, const PrimitiveKind k) {
    switch (k) {
    case PrimitiveKind::void_type: return o << "void";
    case PrimitiveKind::boolean: return o << "boolean";
    case PrimitiveKind::byte: return o << "byte";
    case PrimitiveKind::char_type: return o << "char";
    case PrimitiveKind::short_type: return o << "short";
    case PrimitiveKind::int_type: return o << "int";
    case PrimitiveKind::long_type: return o << "long";
    case PrimitiveKind::float_type: return o << "float";
    case PrimitiveKind::double_type: return o << "double";
    case PrimitiveKind::null_type: return o << "null";
    }
    return o;
}

std::ostream& operator<<(std::ostream& o, const HostValue& v) {
    std::visit(
        [&o](const auto& value) {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                o << "null";
            } else if constexpr (std::is_same_v<T, char16_t> || std::is_same_v<T, int8_t> ||
                                 std::is_same_v<T, int16_t>) {
                o << static_cast<int32_t>(value);
            } else if constexpr (std::is_same_v<T, OpaqueObject>) {
                o << "<" << value.description << ">";
            } else {
                o << ConstantObject{value};
            }
        },
        v);
    return o;
}

} // namespace dftypes

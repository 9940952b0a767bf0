// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#pragma once

// Inputs supplied by the host language front-end: types, declared nullability and literal values.

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace dftypes {

enum class PrimitiveKind {
    void_type,
    boolean,
    byte,
    char_type, ///< unsigned 16-bit
    short_type,
    int_type,
    long_type,
    float_type,
    double_type,
    null_type, ///< the type of the null literal
};

/// A reference type, possibly an intersection of several classes and interfaces.
struct ClassType {
    std::vector<std::string> bounds;
    bool operator==(const ClassType&) const = default;
};

using HostType = std::variant<PrimitiveKind, ClassType>;

inline HostType class_type(std::string name) { return ClassType{.bounds = {std::move(name)}}; }

enum class DeclaredNullability { unknown, not_null, nullable };

struct EnumMember {
    std::string enum_type;
    std::string name;
    bool operator==(const EnumMember&) const = default;
};

/// A final field known to hold a value no other field holds.
struct DeclaredField {
    std::string owner;
    std::string name;
    std::string type;
    bool operator==(const DeclaredField&) const = default;
};

/// The runtime representation of a type, e.g. a class object.
struct TypeLiteral {
    std::string type;
    bool operator==(const TypeLiteral&) const = default;
};

/// Payload of a constant reference. Primitive alternatives are boxed values.
using ConstantObject = std::variant<bool, int32_t, int64_t, float, double, std::string, EnumMember, DeclaredField,
                                    TypeLiteral>;

// Equality with bitwise comparison of floating point values, so that 0.0 and -0.0 differ and NaN equals NaN.
bool same_constant(const ConstantObject& a, const ConstantObject& b);
std::size_t hash_value(const ConstantObject& c);
std::ostream& operator<<(std::ostream& o, const ConstantObject& c);

/// An object the lattice has no constant representation for, described for diagnostics.
struct OpaqueObject {
    std::string description;
};

/// A literal value as handed over by the front-end.
using HostValue = std::variant<std::nullptr_t, bool, char16_t, int8_t, int16_t, int32_t, int64_t, float, double,
                               std::string, EnumMember, DeclaredField, TypeLiteral, OpaqueObject>;

std::ostream& operator<<(std::ostream& o, PrimitiveKind k);
std::ostream& operator<<(std::ostream& o, const HostValue& v);

} // namespace dftypes

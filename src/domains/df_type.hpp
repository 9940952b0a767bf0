// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include <boost/container/flat_set.hpp>

#include "arith/float_bits.hpp"
#include "arith/range_set.hpp"
#include "types/host.hpp"
#include "types/type_constraint.hpp"

namespace dftypes {

class DfType;

/// Nullability of a reference. `null` is only ever reported by nullability_of() for the null constant:
/// a ReferenceType never carries it.
enum class Nullability { null, nullable, not_null, unknown };

enum class Mutability { modifiable, unmodifiable, unknown };

/// A derived scalar property of a referenced object, tracked as its own lattice element.
enum class SpecialField { array_length, string_length, collection_size, unbox, optional_value };

std::ostream& operator<<(std::ostream& o, Nullability n);
std::ostream& operator<<(std::ostream& o, Mutability m);
std::ostream& operator<<(std::ostream& o, SpecialField f);

struct TopType {
    bool operator==(const TopType&) const = default;
};

struct BottomType {
    bool operator==(const BottomType&) const = default;
};

/// `value` is empty for the generic boolean.
struct BooleanType {
    std::optional<bool> value;
    bool operator==(const BooleanType&) const = default;
};

/// A subset of the signed integers of the given width.
/// The wide range is the widest range seen before narrowing; it is convergence metadata and
/// does not take part in equality.
template <int Width>
struct IntegralType {
    static constexpr int width = Width;

    RangeSet range;
    std::optional<RangeSet> wide_range;

    static RangeSet domain() { return RangeSet::signed_domain(Width); }

    [[nodiscard]]
    const RangeSet& effective_wide_range() const {
        return wide_range ? *wide_range : range;
    }

    [[nodiscard]]
    bool is_constant() const {
        return range.constant_value().has_value();
    }

    bool operator==(const IntegralType& o) const { return range == o.range; }
};

using IntType = IntegralType<32>;
using LongType = IntegralType<64>;

enum class FloatKind {
    any,       ///< every value of the type
    zero,      ///< +0.0 or -0.0
    constant,  ///< a single value, compared bitwise
    not_value, ///< every value except the excluded ones
};

template <std::floating_point F>
struct FloatingType {
    using Bits = FloatBits<F>;

    FloatKind kind{FloatKind::any};
    F value{};                                 ///< for constant
    boost::container::flat_set<Bits> excluded; ///< canonical bit patterns, for not_value

    [[nodiscard]]
    bool excludes(const F v) const {
        return excluded.contains(canonical_bits(v));
    }

    bool operator==(const FloatingType& o) const {
        if (kind != o.kind) {
            return false;
        }
        switch (kind) {
        case FloatKind::constant: return same_bits(value, o.value);
        case FloatKind::not_value: return excluded == o.excluded;
        default: return true;
        }
    }
};

using FloatType = FloatingType<float>;
using DoubleType = FloatingType<double>;

/// The null reference and nothing else.
struct NullType {
    bool operator==(const NullType&) const = default;
};

struct ReferenceConstant {
    ConstantObject value;
    bool synthesized{}; ///< freshly built (e.g. a concatenation result) rather than a canonical literal

    bool operator==(const ReferenceConstant& o) const {
        return synthesized == o.synthesized && same_constant(value, o.value);
    }
};

struct SpecialFieldBinding {
    SpecialField field;
    std::shared_ptr<const DfType> type;

    bool operator==(const SpecialFieldBinding& o) const;
};

/// Object references, possibly null (but never only null: that is NullType).
struct ReferenceType {
    TypeConstraint constraint = TypeConstraint::top();
    Nullability nullability = Nullability::unknown;
    Mutability mutability = Mutability::unknown;
    std::optional<SpecialFieldBinding> special;
    bool local{}; ///< refers to a freshly created object that did not escape
    std::optional<ReferenceConstant> constant;

    bool operator==(const ReferenceType&) const = default;
};

using DfTypeVariant =
    std::variant<TopType, BottomType, BooleanType, IntType, LongType, FloatType, DoubleType, NullType, ReferenceType>;

/// An immutable lattice element describing the set of values an expression may take.
///
/// The lattice is bounded by top() (any value) and bottom() (no value). Elements of different
/// families (boolean, int, long, float, double, references) are incomparable: their join is top
/// and their meet is bottom.
class DfType final {
    DfTypeVariant _v;

  public:
    DfType(DfTypeVariant v) : _v(std::move(v)) {}

    static DfType top() { return DfType{TopType{}}; }
    static DfType bottom() { return DfType{BottomType{}}; }

    [[nodiscard]]
    const DfTypeVariant& variant() const {
        return _v;
    }

    template <typename T>
    [[nodiscard]]
    bool is() const {
        return std::holds_alternative<T>(_v);
    }

    template <typename T>
    [[nodiscard]]
    const T* get_if() const {
        return std::get_if<T>(&_v);
    }

    [[nodiscard]]
    bool is_top() const {
        return is<TopType>();
    }

    [[nodiscard]]
    bool is_bottom() const {
        return is<BottomType>();
    }

    // True iff every value of `other` is a value of this type.
    [[nodiscard]]
    bool is_super_type(const DfType& other) const;

    // Least upper bound. Top when the two types have no tighter common representation.
    [[nodiscard]]
    DfType join(const DfType& other) const;

    // Greatest lower bound. Bottom when the two types share no value.
    [[nodiscard]]
    DfType meet(const DfType& other) const;

    // The complement within the same family, or bottom when it cannot be represented.
    // A bottom result means "unknown", not "contradiction".
    [[nodiscard]]
    DfType try_negate() const;

    // A coarser type helping an iterative analysis converge.
    [[nodiscard]]
    DfType widen() const;

    bool operator<=(const DfType& other) const { return other.is_super_type(*this); }

    DfType operator|(const DfType& other) const { return join(other); }

    DfType operator&(const DfType& other) const { return meet(other); }

    bool operator==(const DfType& other) const = default;

    friend std::size_t hash_value(const DfType& t);

    friend std::ostream& operator<<(std::ostream& o, const DfType& t);

    [[nodiscard]]
    std::string to_string() const;
};

template <typename T>
concept constant_kind = std::same_as<T, bool> || std::same_as<T, int32_t> || std::same_as<T, int64_t> ||
                        std::same_as<T, float> || std::same_as<T, double>;

// The single value of a primitive or boxed constant of type T, if `t` is one.
template <constant_kind T>
std::optional<T> constant_of(const DfType& t);

// The payload of a constant reference (boxed primitive constants included).
std::optional<ConstantObject> constant_object_of(const DfType& t);

// Nullability::null for the null constant, the stored nullability for references, unknown otherwise.
Nullability nullability_of(const DfType& t);

bool is_local(const DfType& t);

// The value range of an int or long type.
std::optional<RangeSet> range_of(const DfType& t);

} // namespace dftypes

template <>
struct std::hash<dftypes::DfType> {
    std::size_t operator()(const dftypes::DfType& t) const noexcept { return hash_value(t); }
};

// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#include <sstream>
#include <stdexcept>

#include <gsl/narrow>

#include "config_options.hpp"
#include "domains/df_types.hpp"
#include "types/type_hierarchy.hpp"

namespace dftypes {

const DfType& top_type() {
    static const DfType res = DfType::top();
    return res;
}

const DfType& bottom_type() {
    static const DfType res = DfType::bottom();
    return res;
}

const DfType& boolean_type() {
    static const DfType res{BooleanType{}};
    return res;
}

const DfType& true_type() {
    static const DfType res{BooleanType{true}};
    return res;
}

const DfType& false_type() {
    static const DfType res{BooleanType{false}};
    return res;
}

const DfType& int_type() {
    static const DfType res{IntType{.range = IntType::domain(), .wide_range = {}}};
    return res;
}

const DfType& long_type() {
    static const DfType res{LongType{.range = LongType::domain(), .wide_range = {}}};
    return res;
}

const DfType& float_type() {
    static const DfType res{FloatType{}};
    return res;
}

const DfType& float_zero() {
    static const DfType res{FloatType{.kind = FloatKind::zero, .value = {}, .excluded = {}}};
    return res;
}

const DfType& double_type() {
    static const DfType res{DoubleType{}};
    return res;
}

const DfType& double_zero() {
    static const DfType res{DoubleType{.kind = FloatKind::zero, .value = {}, .excluded = {}}};
    return res;
}

const DfType& null_type() {
    static const DfType res{NullType{}};
    return res;
}

const DfType& not_null_object() {
    static const DfType res{ReferenceType{.nullability = Nullability::not_null}};
    return res;
}

const DfType& object_or_null() {
    static const DfType res{ReferenceType{}};
    return res;
}

const DfType& local_object() {
    static const DfType res{ReferenceType{.nullability = Nullability::not_null, .local = true}};
    return res;
}

DfType boolean_value(const bool value) { return value ? true_type() : false_type(); }

template <int W>
static DfType integral_range(const RangeSet& range, const std::optional<RangeSet>& wide_range) {
    using T = IntegralType<W>;
    if (range.is_empty()) {
        return DfType::bottom();
    }
    // The wide range always covers the range.
    const std::optional<RangeSet> wide =
        wide_range ? std::optional<RangeSet>{wide_range->join(range).meet(T::domain())} : std::nullopt;
    if (!wide || *wide == range || !thread_local_lattice_options.track_wide_range) {
        if (range == T::domain()) {
            return W == 32 ? int_type() : long_type();
        }
        return DfType{T{.range = range, .wide_range = {}}};
    }
    return DfType{T{.range = range, .wide_range = wide}};
}

template <int W>
static void require_in_domain(const RangeSet& range) {
    if (!IntegralType<W>::domain().contains(range)) {
        std::ostringstream s;
        s << "Range " << range << " is not representable in a " << W << "-bit signed integer";
        throw std::invalid_argument(s.str());
    }
}

DfType int_value(const int32_t value) { return DfType{IntType{.range = RangeSet::point(value), .wide_range = {}}}; }

DfType int_range(const RangeSet& range) {
    require_in_domain<32>(range);
    return integral_range<32>(range, {});
}

DfType int_range_clamped(const RangeSet& range) { return int_range(range.meet(IntType::domain())); }

DfType int_range(const RangeSet& range, const std::optional<RangeSet>& wide_range) {
    require_in_domain<32>(range);
    return integral_range<32>(range, wide_range);
}

DfType long_value(const int64_t value) {
    return DfType{LongType{.range = RangeSet::point(value), .wide_range = {}}};
}

DfType long_range(const RangeSet& range) {
    require_in_domain<64>(range);
    return integral_range<64>(range, {});
}

DfType long_range(const RangeSet& range, const std::optional<RangeSet>& wide_range) {
    require_in_domain<64>(range);
    return integral_range<64>(range, wide_range);
}

DfType range_clamped(const RangeSet& range, const bool is_long) {
    return is_long ? long_range(range.meet(LongType::domain())) : int_range_clamped(range);
}

DfType float_value(const float value) {
    return DfType{FloatType{.kind = FloatKind::constant, .value = value, .excluded = {}}};
}

DfType double_value(const double value) {
    return DfType{DoubleType{.kind = FloatKind::constant, .value = value, .excluded = {}}};
}

template <std::floating_point F>
static DfType not_values(const std::initializer_list<F> excluded) {
    FloatingType<F> res{.kind = FloatKind::not_value, .value = {}, .excluded = {}};
    for (const F v : excluded) {
        res.excluded.insert(canonical_bits(v));
    }
    if (res.excluded.empty()) {
        return std::is_same_v<F, float> ? float_type() : double_type();
    }
    return DfType{std::move(res)};
}

DfType float_not_values(const std::initializer_list<float> excluded) { return not_values(excluded); }

DfType double_not_values(const std::initializer_list<double> excluded) { return not_values(excluded); }

static std::optional<DfType> primitive_constant_impl(const HostValue& value) {
    return std::visit(
        [](const auto& v) -> std::optional<DfType> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, bool>) {
                return boolean_value(v);
            } else if constexpr (std::is_same_v<T, char16_t> || std::is_same_v<T, int8_t> ||
                                 std::is_same_v<T, int16_t> || std::is_same_v<T, int32_t>) {
                return int_value(static_cast<int32_t>(v));
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return long_value(v);
            } else if constexpr (std::is_same_v<T, float>) {
                return float_value(v);
            } else if constexpr (std::is_same_v<T, double>) {
                return double_value(v);
            } else {
                return std::nullopt;
            }
        },
        value);
}

DfType primitive_constant(const HostValue& value) {
    if (auto res = primitive_constant_impl(value)) {
        return *res;
    }
    std::ostringstream s;
    s << "Invalid value supplied: " << value << " (not a primitive value)";
    throw std::invalid_argument(s.str());
}

// The object payload of a non-primitive, non-null host value.
static ConstantObject to_constant_object(const HostValue& value) {
    return std::visit(
        [&value](const auto& v) -> ConstantObject {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, EnumMember> ||
                          std::is_same_v<T, DeclaredField> || std::is_same_v<T, TypeLiteral>) {
                return v;
            } else {
                std::ostringstream s;
                s << "Unsupported constant object: " << value;
                throw std::invalid_argument(s.str());
            }
        },
        value);
}

static ReferenceType make_reference_constant(const ConstantObject& value, TypeConstraint constraint,
                                             const bool synthesized) {
    ReferenceType res{.constraint = std::move(constraint),
                      .nullability = Nullability::not_null,
                      .mutability = Mutability::unknown,
                      .special = {},
                      .local = false,
                      .constant = ReferenceConstant{.value = value, .synthesized = synthesized}};
    if (const auto s = std::get_if<std::string>(&value)) {
        res.special = SpecialFieldBinding{.field = SpecialField::string_length,
                                          .type = std::make_shared<const DfType>(int_value(gsl::narrow<int32_t>(s->size())))};
    }
    return res;
}

static TypeConstraint constraint_of(const HostType& type) {
    if (const auto c = std::get_if<ClassType>(&type)) {
        return TypeConstraint::instance_of_all(c->bounds);
    }
    std::ostringstream s;
    s << "Not a reference type: " << std::get<PrimitiveKind>(type);
    throw std::invalid_argument(s.str());
}

DfType reference_constant(const ConstantObject& value, const HostType& type) {
    return DfType{make_reference_constant(value, constraint_of(type), false)};
}

DfType constant(const HostValue& value, const HostType& type) {
    if (std::holds_alternative<std::nullptr_t>(value)) {
        return null_type();
    }
    if (auto res = primitive_constant_impl(value)) {
        return *res;
    }
    return DfType{make_reference_constant(to_constant_object(value), constraint_of(type), false)};
}

DfType constant(const HostValue& value, const DfType& type) {
    if (std::holds_alternative<std::nullptr_t>(value)) {
        return null_type();
    }
    if (auto res = primitive_constant_impl(value)) {
        return *res;
    }
    const auto ref = type.get_if<ReferenceType>();
    if (ref == nullptr) {
        std::ostringstream s;
        s << "Not reference type: " << type << "; constant: " << value;
        throw std::invalid_argument(s.str());
    }
    return DfType{make_reference_constant(to_constant_object(value), ref->constraint, false)};
}

DfType concatenation_result(const std::string& value) {
    const auto constraint = TypeConstraint::exact(thread_local_type_hierarchy->string_type());
    return DfType{make_reference_constant(value, constraint, true)};
}

DfType default_value(const HostType& type) {
    if (const auto kind = std::get_if<PrimitiveKind>(&type)) {
        switch (*kind) {
        case PrimitiveKind::boolean: return false_type();
        case PrimitiveKind::byte:
        case PrimitiveKind::char_type:
        case PrimitiveKind::short_type:
        case PrimitiveKind::int_type: return int_value(0);
        case PrimitiveKind::long_type: return long_value(0);
        case PrimitiveKind::float_type: return float_value(0.0f);
        case PrimitiveKind::double_type: return double_value(0.0);
        case PrimitiveKind::void_type:
        case PrimitiveKind::null_type: break;
        }
    }
    return null_type();
}

RangeSet type_range(const PrimitiveKind kind) {
    switch (kind) {
    case PrimitiveKind::byte: return RangeSet::signed_domain(8);
    case PrimitiveKind::short_type: return RangeSet::signed_domain(16);
    case PrimitiveKind::char_type: return RangeSet::of({Interval::unsigned_int(16)});
    case PrimitiveKind::int_type: return RangeSet::int_domain();
    case PrimitiveKind::long_type: return RangeSet::long_domain();
    default: return RangeSet::empty();
    }
}

static Nullability from_declared(const DeclaredNullability nullability) {
    switch (nullability) {
    case DeclaredNullability::not_null: return Nullability::not_null;
    case DeclaredNullability::nullable: return Nullability::nullable;
    case DeclaredNullability::unknown: return Nullability::unknown;
    }
    return Nullability::unknown;
}

DfType typed_object(const std::optional<HostType>& type, const DeclaredNullability nullability) {
    if (!type) {
        return top_type();
    }
    if (const auto kind = std::get_if<PrimitiveKind>(&*type)) {
        switch (*kind) {
        case PrimitiveKind::void_type: return bottom_type();
        case PrimitiveKind::boolean: return boolean_type();
        case PrimitiveKind::int_type: return int_type();
        case PrimitiveKind::char_type:
        case PrimitiveKind::short_type:
        case PrimitiveKind::byte: return int_range(type_range(*kind));
        case PrimitiveKind::long_type: return long_type();
        case PrimitiveKind::float_type: return float_type();
        case PrimitiveKind::double_type: return double_type();
        case PrimitiveKind::null_type: return null_type();
        }
    }
    const TypeConstraint constraint = constraint_of(*type);
    if (constraint.is_bottom()) {
        return nullability == DeclaredNullability::not_null ? bottom_type() : null_type();
    }
    return DfType{ReferenceType{.constraint = constraint, .nullability = from_declared(nullability)}};
}

DfType custom_object(const TypeConstraint& constraint, const Nullability nullability, const Mutability mutability,
                     const std::optional<SpecialField> special_field, const DfType& special_type) {
    if (nullability == Nullability::null) {
        throw std::invalid_argument("custom_object: null nullability is represented by null_type()");
    }
    ReferenceType res{.constraint = constraint, .nullability = nullability, .mutability = mutability};
    if (special_field && !special_type.is_top()) {
        if (special_type.is_bottom()) {
            return bottom_type();
        }
        res.special = SpecialFieldBinding{.field = *special_field, .type = std::make_shared<const DfType>(special_type)};
    }
    return DfType{std::move(res)};
}

} // namespace dftypes

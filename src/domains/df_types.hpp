// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#pragma once

// Commonly used types and the smart constructors that keep every DfType in canonical form:
// a single-valued range is a constant, the full domain is the shared generic type, an empty
// range is bottom.

#include <initializer_list>
#include <optional>

#include "domains/df_type.hpp"

namespace dftypes {

// Shared singletons. Built once on first use and never modified.
const DfType& top_type();
const DfType& bottom_type();
const DfType& boolean_type();
const DfType& true_type();
const DfType& false_type();
const DfType& int_type();
const DfType& long_type();
const DfType& float_type();
const DfType& float_zero();
const DfType& double_type();
const DfType& double_zero();
const DfType& null_type();
const DfType& not_null_object();
const DfType& object_or_null();
const DfType& local_object();

DfType boolean_value(bool value);

DfType int_value(int32_t value);

// Throws std::invalid_argument if the range has values outside the 32-bit signed domain.
DfType int_range(const RangeSet& range);

// Values outside the 32-bit signed domain are dropped.
DfType int_range_clamped(const RangeSet& range);

// Keeps `wide_range` alongside the range unless it is redundant.
DfType int_range(const RangeSet& range, const std::optional<RangeSet>& wide_range);

DfType long_value(int64_t value);

// Throws std::invalid_argument if the range has values outside the 64-bit signed domain.
DfType long_range(const RangeSet& range);

DfType long_range(const RangeSet& range, const std::optional<RangeSet>& wide_range);

// The range clamped to the long or int domain, depending on is_long.
DfType range_clamped(const RangeSet& range, bool is_long);

DfType float_value(float value);
DfType double_value(double value);

// Every float except the given values. The generic float if nothing is excluded.
DfType float_not_values(std::initializer_list<float> excluded);
DfType double_not_values(std::initializer_list<double> excluded);

// A constant of the given type. Primitive values (including char, byte and short, widened to int)
// become primitive constants, null becomes the null type, other supported objects become reference
// constants bounded by `type`. Throws std::invalid_argument for unsupported objects.
DfType constant(const HostValue& value, const HostType& type);

// Same, with the reference bound taken from an existing reference type.
// Throws std::invalid_argument if a reference constant is requested and `type` is not a reference type.
DfType constant(const HostValue& value, const DfType& type);

DfType reference_constant(const ConstantObject& value, const HostType& type);

// Throws std::invalid_argument if `value` is not a primitive value.
DfType primitive_constant(const HostValue& value);

// The result of a string concatenation: a freshly built string, equal to but not the same object as a literal.
DfType concatenation_result(const std::string& value);

// The value a field of this type holds before it is assigned: false, 0, 0.0 or null.
DfType default_value(const HostType& type);

// Any value of the given type. An absent type gives top and void gives bottom.
DfType typed_object(const std::optional<HostType>& type, DeclaredNullability nullability);

// Low-level constructor of a generic reference type.
// Throws std::invalid_argument when nullability is Nullability::null: use null_type() instead.
DfType custom_object(const TypeConstraint& constraint, Nullability nullability, Mutability mutability,
                     std::optional<SpecialField> special_field, const DfType& special_type);

// Range of values of an integral primitive kind, empty for other kinds.
RangeSet type_range(PrimitiveKind kind);

} // namespace dftypes

// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#pragma once

// Per-family algebra used by DfType's dispatch. Both operands always belong to the same family
// (or are a reference and the null constant); top and bottom are resolved before dispatching.

#include "domains/df_type.hpp"

namespace dftypes::ops {

bool is_super_type(const BooleanType& self, const BooleanType& other);
DfType join(const BooleanType& a, const BooleanType& b);
DfType meet(const BooleanType& a, const BooleanType& b);
DfType try_negate(const BooleanType& t);

template <int W>
bool is_super_type(const IntegralType<W>& self, const IntegralType<W>& other);
template <int W>
DfType join(const IntegralType<W>& a, const IntegralType<W>& b);
template <int W>
DfType meet(const IntegralType<W>& a, const IntegralType<W>& b);
template <int W>
DfType try_negate(const IntegralType<W>& t);
template <int W>
DfType widen(const IntegralType<W>& t);

template <std::floating_point F>
bool is_super_type(const FloatingType<F>& self, const FloatingType<F>& other);
template <std::floating_point F>
DfType join(const FloatingType<F>& a, const FloatingType<F>& b);
template <std::floating_point F>
DfType meet(const FloatingType<F>& a, const FloatingType<F>& b);
template <std::floating_point F>
DfType try_negate(const FloatingType<F>& t);

bool is_super_type(const ReferenceType& self, const ReferenceType& other);
bool is_super_type(const ReferenceType& self, const NullType& other);
DfType join(const ReferenceType& a, const ReferenceType& b);
DfType join(const ReferenceType& a, const NullType& b);
DfType meet(const ReferenceType& a, const ReferenceType& b);
DfType meet(const ReferenceType& a, const NullType& b);
DfType try_negate(const ReferenceType& t);
DfType try_negate(const NullType& t);
DfType widen(const ReferenceType& t);

} // namespace dftypes::ops

// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#include <algorithm>
#include <iterator>

#include "config_options.hpp"
#include "domains/df_type_ops.hpp"
#include "domains/df_types.hpp"
#include "utils/debug.hpp"

namespace dftypes::ops {

bool is_super_type(const BooleanType& self, const BooleanType& other) {
    return !self.value || self.value == other.value;
}

DfType join(const BooleanType& a, const BooleanType& b) {
    if (a == b) {
        return DfType{a};
    }
    return boolean_type();
}

DfType meet(const BooleanType& a, const BooleanType& b) {
    if (!a.value) {
        return DfType{b};
    }
    if (!b.value || a == b) {
        return DfType{a};
    }
    return DfType::bottom();
}

DfType try_negate(const BooleanType& t) {
    if (!t.value) {
        return DfType::bottom();
    }
    return boolean_value(!*t.value);
}

// Integral types

template <int W>
static DfType make_integral(const RangeSet& range, const std::optional<RangeSet>& wide_range) {
    if constexpr (W == 32) {
        return int_range(range, wide_range);
    } else {
        return long_range(range, wide_range);
    }
}

template <int W>
bool is_super_type(const IntegralType<W>& self, const IntegralType<W>& other) {
    return self.range.contains(other.range);
}

template <int W>
DfType join(const IntegralType<W>& a, const IntegralType<W>& b) {
    RangeSet range = a.range.join(b.range);
    if (range.interval_count() > thread_local_lattice_options.max_range_intervals) {
        DFTYPES_LOG("range", std::cout << "join of " << a.range << " and " << b.range << " has "
                                       << range.interval_count() << " intervals, widened to " << range.hull()
                                       << "\n");
        range = range.hull();
    }
    return make_integral<W>(range, a.effective_wide_range().join(b.effective_wide_range()));
}

template <int W>
DfType meet(const IntegralType<W>& a, const IntegralType<W>& b) {
    const RangeSet range = a.range.meet(b.range);
    if (range.is_empty()) {
        return DfType::bottom();
    }
    return make_integral<W>(range, a.effective_wide_range().meet(b.effective_wide_range()));
}

template <int W>
DfType try_negate(const IntegralType<W>& t) {
    const RangeSet range = IntegralType<W>::domain().subtract(t.range);
    if (range.is_empty()) {
        return DfType::bottom();
    }
    return make_integral<W>(range, {});
}

template <int W>
DfType widen(const IntegralType<W>& t) {
    if (!t.wide_range) {
        return DfType{t};
    }
    return make_integral<W>(*t.wide_range, {});
}

template bool is_super_type(const IntType&, const IntType&);
template bool is_super_type(const LongType&, const LongType&);
template DfType join(const IntType&, const IntType&);
template DfType join(const LongType&, const LongType&);
template DfType meet(const IntType&, const IntType&);
template DfType meet(const LongType&, const LongType&);
template DfType try_negate(const IntType&);
template DfType try_negate(const LongType&);
template DfType widen(const IntType&);
template DfType widen(const LongType&);

// Floating point types

template <std::floating_point F>
static DfType generic_floating() {
    if constexpr (std::is_same_v<F, float>) {
        return float_type();
    } else {
        return double_type();
    }
}

template <std::floating_point F>
static DfType floating_zero() {
    if constexpr (std::is_same_v<F, float>) {
        return float_zero();
    } else {
        return double_zero();
    }
}

template <std::floating_point F>
static DfType floating_constant(const F value) {
    return DfType{FloatingType<F>{.kind = FloatKind::constant, .value = value, .excluded = {}}};
}

template <std::floating_point F>
static DfType floating_not_values(boost::container::flat_set<FloatBits<F>> excluded) {
    if (excluded.empty()) {
        return generic_floating<F>();
    }
    return DfType{FloatingType<F>{.kind = FloatKind::not_value, .value = {}, .excluded = std::move(excluded)}};
}

template <std::floating_point F>
static FloatBits<F> plus_zero() {
    return canonical_bits(F{0});
}

template <std::floating_point F>
static FloatBits<F> minus_zero() {
    return canonical_bits(-F{0});
}

template <std::floating_point F>
static bool is_zero_constant(const FloatingType<F>& t) {
    return t.kind == FloatKind::constant && t.value == F{0};
}

template <std::floating_point F>
bool is_super_type(const FloatingType<F>& self, const FloatingType<F>& other) {
    switch (self.kind) {
    case FloatKind::any: return true;
    case FloatKind::zero: return other.kind == FloatKind::zero || is_zero_constant(other);
    case FloatKind::constant: return self == other;
    case FloatKind::not_value:
        switch (other.kind) {
        case FloatKind::any: return false;
        case FloatKind::zero:
            return !self.excluded.contains(plus_zero<F>()) && !self.excluded.contains(minus_zero<F>());
        case FloatKind::constant: return !self.excludes(other.value);
        case FloatKind::not_value:
            return std::includes(other.excluded.begin(), other.excluded.end(), self.excluded.begin(),
                                 self.excluded.end());
        }
    }
    return false;
}

template <std::floating_point F>
DfType join(const FloatingType<F>& a, const FloatingType<F>& b) {
    if (a.kind == FloatKind::any || b.kind == FloatKind::any) {
        return generic_floating<F>();
    }
    if (a == b) {
        return DfType{a};
    }
    if (b.kind == FloatKind::not_value && a.kind != FloatKind::not_value) {
        return join(b, a);
    }
    if (a.kind == FloatKind::not_value) {
        auto excluded = a.excluded;
        switch (b.kind) {
        case FloatKind::constant: excluded.erase(canonical_bits(b.value)); break;
        case FloatKind::zero:
            excluded.erase(plus_zero<F>());
            excluded.erase(minus_zero<F>());
            break;
        default: {
            boost::container::flat_set<FloatBits<F>> common;
            std::set_intersection(a.excluded.begin(), a.excluded.end(), b.excluded.begin(), b.excluded.end(),
                                  std::inserter(common, common.end()));
            excluded = std::move(common);
        }
        }
        return floating_not_values<F>(std::move(excluded));
    }
    // Two different elements among zero and constants: only zeros share a representation.
    const bool a_zero = a.kind == FloatKind::zero || is_zero_constant(a);
    const bool b_zero = b.kind == FloatKind::zero || is_zero_constant(b);
    if (a_zero && b_zero) {
        return floating_zero<F>();
    }
    return generic_floating<F>();
}

template <std::floating_point F>
DfType meet(const FloatingType<F>& a, const FloatingType<F>& b) {
    if (a.kind == FloatKind::any) {
        return DfType{b};
    }
    if (b.kind == FloatKind::any || a == b) {
        return DfType{a};
    }
    if (is_super_type(a, b)) {
        return DfType{b};
    }
    if (is_super_type(b, a)) {
        return DfType{a};
    }
    if (a.kind == FloatKind::not_value && b.kind == FloatKind::not_value) {
        auto excluded = a.excluded;
        excluded.insert(b.excluded.begin(), b.excluded.end());
        return floating_not_values<F>(std::move(excluded));
    }
    const FloatingType<F>& not_value = a.kind == FloatKind::not_value ? a : b;
    const FloatingType<F>& other = a.kind == FloatKind::not_value ? b : a;
    if (not_value.kind == FloatKind::not_value && other.kind == FloatKind::zero) {
        const bool plus = not_value.excluded.contains(plus_zero<F>());
        const bool minus = not_value.excluded.contains(minus_zero<F>());
        if (plus != minus) {
            return floating_constant<F>(plus ? -F{0} : F{0});
        }
    }
    return DfType::bottom();
}

template <std::floating_point F>
DfType try_negate(const FloatingType<F>& t) {
    switch (t.kind) {
    case FloatKind::any: return DfType::bottom();
    case FloatKind::zero: return floating_not_values<F>({plus_zero<F>(), minus_zero<F>()});
    case FloatKind::constant: return floating_not_values<F>({canonical_bits(t.value)});
    case FloatKind::not_value:
        if (t.excluded.size() == 1) {
            return floating_constant<F>(from_bits<F>(*t.excluded.begin()));
        }
        if (t.excluded.size() == 2 && t.excluded.contains(plus_zero<F>()) && t.excluded.contains(minus_zero<F>())) {
            return floating_zero<F>();
        }
        return DfType::bottom();
    }
    return DfType::bottom();
}

template bool is_super_type(const FloatType&, const FloatType&);
template bool is_super_type(const DoubleType&, const DoubleType&);
template DfType join(const FloatType&, const FloatType&);
template DfType join(const DoubleType&, const DoubleType&);
template DfType meet(const FloatType&, const FloatType&);
template DfType meet(const DoubleType&, const DoubleType&);
template DfType try_negate(const FloatType&);
template DfType try_negate(const DoubleType&);

} // namespace dftypes::ops

// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <bit>
#include <cmath>
#include <concepts>
#include <cstdint>
#include <limits>
#include <type_traits>

namespace dftypes {

template <std::floating_point F>
using FloatBits = std::conditional_t<sizeof(F) == sizeof(uint32_t), uint32_t, uint64_t>;

// Bit pattern of a floating point value with every NaN mapped to the same pattern.
template <std::floating_point F>
FloatBits<F> canonical_bits(F value) {
    if (std::isnan(value)) {
        value = std::numeric_limits<F>::quiet_NaN();
    }
    return std::bit_cast<FloatBits<F>>(value);
}

template <std::floating_point F>
F from_bits(const FloatBits<F> bits) {
    return std::bit_cast<F>(bits);
}

template <std::floating_point F>
bool same_bits(const F a, const F b) {
    return canonical_bits(a) == canonical_bits(b);
}

} // namespace dftypes

// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <concepts>
#include <cstdint>
#include <limits>
#include <string>
#include <typeinfo>
#include <utility>

#include <boost/multiprecision/cpp_int.hpp>

#include "utils/debug.hpp"

using boost::multiprecision::cpp_int;

namespace dftypes {

/// Unbounded integer. Range requests are expressed in Number so that values outside the
/// 64-bit domain can be detected and clamped instead of silently wrapping.
class Number final {
    cpp_int _n{};

  public:
    Number() = default;
    Number(cpp_int n) : _n(std::move(n)) {}
    Number(std::integral auto n) : _n{n} {}

    template <std::integral T>
    T narrow() const {
        if (!fits<T>()) {
            DFTYPES_ERROR("Number ", _n, " does not fit into ", typeid(T).name());
        }
        return static_cast<T>(_n);
    }

    [[nodiscard]]
    friend std::size_t hash_value(const Number& z) {
        return boost::multiprecision::hash_value(z._n);
    }

    template <std::integral T>
    [[nodiscard]]
    bool fits() const {
        return std::numeric_limits<T>::min() <= _n && _n <= std::numeric_limits<T>::max();
    }

    static Number max_int(const int width) { return Number{(cpp_int(1) << (width - 1)) - 1}; }

    static Number min_int(const int width) { return Number{-(cpp_int(1) << (width - 1))}; }

    static Number max_uint(const int width) { return max_int(width + 1); }

    Number operator+(const Number& x) const { return Number(_n + x._n); }

    Number operator-(const Number& x) const { return Number(_n - x._n); }

    Number operator-() const { return Number(-_n); }

    bool operator==(const Number& x) const { return _n == x._n; }

    bool operator!=(const Number& x) const { return _n != x._n; }

    bool operator<(const Number& x) const { return _n < x._n; }

    bool operator<=(const Number& x) const { return _n <= x._n; }

    bool operator>(const Number& x) const { return _n > x._n; }

    bool operator>=(const Number& x) const { return _n >= x._n; }

    friend std::ostream& operator<<(std::ostream& o, const Number& z) { return o << z._n.str(); }

    [[nodiscard]]
    std::string to_string() const {
        return _n.str();
    }
}; // class Number

} // namespace dftypes

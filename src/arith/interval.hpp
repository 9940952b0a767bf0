// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: Apache-2.0
/*******************************************************************************
 *
 * A closed interval of arbitrary-precision integers. Used as the building block
 * of RangeSet; unlike a numerical abstract domain it has no infinite bounds.
 *
 ******************************************************************************/

#pragma once

#include <algorithm>
#include <optional>
#include <string>

#include "arith/num_big.hpp"

namespace dftypes {

class Interval final {
    Number _lb;
    Number _ub;

  public:
    static Interval bottom() { return Interval{}; }

  private:
    Interval() : _lb{0}, _ub{-1} {}

  public:
    Interval(const Number& lb, const Number& ub) : _lb(lb > ub ? Number{0} : lb), _ub(lb > ub ? Number{-1} : ub) {}

    template <std::integral T>
    Interval(T lb, T ub) : Interval(Number{lb}, Number{ub}) {}

    explicit Interval(const Number& n) : _lb(n), _ub(n) {}
    explicit Interval(std::integral auto n) : _lb(n), _ub(n) {}

    Interval(const Interval& i) = default;
    Interval& operator=(const Interval& i) = default;

    [[nodiscard]]
    const Number& lb() const {
        return _lb;
    }

    [[nodiscard]]
    const Number& ub() const {
        return _ub;
    }

    [[nodiscard]]
    bool is_bottom() const {
        return _lb > _ub;
    }

    [[nodiscard]]
    explicit operator bool() const {
        return !is_bottom();
    }

    bool operator==(const Interval& x) const {
        if (is_bottom()) {
            return x.is_bottom();
        }
        return _lb == x._lb && _ub == x._ub;
    }

    bool operator!=(const Interval& x) const { return !operator==(x); }

    bool operator<=(const Interval& x) const {
        if (is_bottom()) {
            return true;
        } else if (x.is_bottom()) {
            return false;
        } else {
            return x._lb <= _lb && _ub <= x._ub;
        }
    }

    // Convex hull.
    Interval operator|(const Interval& x) const {
        if (is_bottom()) {
            return x;
        } else if (x.is_bottom()) {
            return *this;
        } else {
            return Interval{std::min(_lb, x._lb), std::max(_ub, x._ub)};
        }
    }

    Interval operator&(const Interval& x) const {
        if (is_bottom() || x.is_bottom()) {
            return bottom();
        } else {
            return Interval{std::max(_lb, x._lb), std::min(_ub, x._ub)};
        }
    }

    // True if the two intervals overlap or touch, i.e. their union is an interval.
    [[nodiscard]]
    bool mergeable_with(const Interval& x) const {
        if (is_bottom() || x.is_bottom()) {
            return true;
        }
        return _lb <= x._ub + 1 && x._lb <= _ub + 1;
    }

    [[nodiscard]]
    bool is_singleton() const {
        return _lb == _ub;
    }

    [[nodiscard]]
    std::optional<Number> singleton() const {
        if (is_singleton()) {
            return _lb;
        }
        return {};
    }

    [[nodiscard]]
    bool contains(const Number& n) const {
        return !is_bottom() && _lb <= n && n <= _ub;
    }

    // Return an interval in the range [INT_MIN, INT_MAX] of the given bit width.
    static Interval signed_int(const int width) { return Interval{Number::min_int(width), Number::max_int(width)}; }

    // Return an interval in the range [0, UINT_MAX] of the given bit width.
    static Interval unsigned_int(const int width) { return Interval{Number{0}, Number::max_uint(width)}; }

    friend std::ostream& operator<<(std::ostream& o, const Interval& interval);

    [[nodiscard]]
    std::string to_string() const;
}; // class Interval

} // namespace dftypes

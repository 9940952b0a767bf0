// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "arith/interval.hpp"

namespace dftypes {

/// A set of integers represented as sorted, disjoint and non-adjacent closed intervals.
class RangeSet final {
    std::vector<Interval> _intervals;

    explicit RangeSet(std::vector<Interval> intervals);

  public:
    RangeSet() = default;

    static RangeSet empty() { return RangeSet{}; }
    static RangeSet point(const Number& n) { return RangeSet{std::vector<Interval>{Interval{n}}}; }
    static RangeSet range(const Number& lb, const Number& ub);
    static RangeSet of(const std::vector<Interval>& intervals);

    // Domain of a signed integer of the given bit width.
    static RangeSet signed_domain(int width);
    static RangeSet int_domain() { return signed_domain(32); }
    static RangeSet long_domain() { return signed_domain(64); }
    static RangeSet all() { return long_domain(); }

    [[nodiscard]]
    bool is_empty() const {
        return _intervals.empty();
    }

    [[nodiscard]]
    const std::vector<Interval>& intervals() const {
        return _intervals;
    }

    [[nodiscard]]
    std::size_t interval_count() const {
        return _intervals.size();
    }

    [[nodiscard]]
    std::optional<Number> min() const;
    [[nodiscard]]
    std::optional<Number> max() const;

    // The single value of this set, if it contains exactly one.
    [[nodiscard]]
    std::optional<Number> constant_value() const;

    [[nodiscard]]
    bool contains(const Number& n) const;
    [[nodiscard]]
    bool contains(const RangeSet& other) const;

    [[nodiscard]]
    bool intersects(const RangeSet& other) const;

    // Union.
    [[nodiscard]]
    RangeSet join(const RangeSet& other) const;

    // Intersection.
    [[nodiscard]]
    RangeSet meet(const RangeSet& other) const;

    // Set difference.
    [[nodiscard]]
    RangeSet subtract(const RangeSet& other) const;

    // Smallest single interval containing this set.
    [[nodiscard]]
    RangeSet hull() const;

    bool operator==(const RangeSet& other) const { return _intervals == other._intervals; }
    bool operator!=(const RangeSet& other) const { return !operator==(other); }

    friend std::size_t hash_value(const RangeSet& r);

    friend std::ostream& operator<<(std::ostream& o, const RangeSet& r);

    [[nodiscard]]
    std::string to_string() const;
};

} // namespace dftypes

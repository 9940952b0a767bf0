// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#include <algorithm>
#include <sstream>

#include <boost/container_hash/hash.hpp>

#include "arith/range_set.hpp"

namespace dftypes {

// Sorts, drops empty intervals and merges overlapping or adjacent ones.
static std::vector<Interval> normalize(std::vector<Interval> intervals) {
    std::erase_if(intervals, [](const Interval& i) { return i.is_bottom(); });
    std::ranges::sort(intervals, [](const Interval& a, const Interval& b) { return a.lb() < b.lb(); });
    std::vector<Interval> res;
    for (const Interval& i : intervals) {
        if (!res.empty() && res.back().mergeable_with(i)) {
            res.back() = res.back() | i;
        } else {
            res.push_back(i);
        }
    }
    return res;
}

RangeSet::RangeSet(std::vector<Interval> intervals) : _intervals(normalize(std::move(intervals))) {}

RangeSet RangeSet::range(const Number& lb, const Number& ub) {
    return RangeSet{std::vector<Interval>{Interval{lb, ub}}};
}

RangeSet RangeSet::of(const std::vector<Interval>& intervals) { return RangeSet{intervals}; }

RangeSet RangeSet::signed_domain(const int width) {
    return RangeSet{std::vector<Interval>{Interval::signed_int(width)}};
}

std::optional<Number> RangeSet::min() const {
    if (_intervals.empty()) {
        return {};
    }
    return _intervals.front().lb();
}

std::optional<Number> RangeSet::max() const {
    if (_intervals.empty()) {
        return {};
    }
    return _intervals.back().ub();
}

std::optional<Number> RangeSet::constant_value() const {
    if (_intervals.size() != 1) {
        return {};
    }
    return _intervals.front().singleton();
}

bool RangeSet::contains(const Number& n) const {
    return std::ranges::any_of(_intervals, [&](const Interval& i) { return i.contains(n); });
}

bool RangeSet::contains(const RangeSet& other) const {
    // Each interval of other must lie inside a single interval of this set, since intervals are non-adjacent.
    auto it = _intervals.begin();
    for (const Interval& o : other._intervals) {
        while (it != _intervals.end() && it->ub() < o.lb()) {
            ++it;
        }
        if (it == _intervals.end() || !(o <= *it)) {
            return false;
        }
    }
    return true;
}

bool RangeSet::intersects(const RangeSet& other) const { return !meet(other).is_empty(); }

RangeSet RangeSet::join(const RangeSet& other) const {
    std::vector<Interval> all = _intervals;
    all.insert(all.end(), other._intervals.begin(), other._intervals.end());
    return RangeSet{std::move(all)};
}

RangeSet RangeSet::meet(const RangeSet& other) const {
    std::vector<Interval> res;
    auto a = _intervals.begin();
    auto b = other._intervals.begin();
    while (a != _intervals.end() && b != other._intervals.end()) {
        if (const Interval i = *a & *b) {
            res.push_back(i);
        }
        if (a->ub() < b->ub()) {
            ++a;
        } else {
            ++b;
        }
    }
    return RangeSet{std::move(res)};
}

RangeSet RangeSet::subtract(const RangeSet& other) const {
    std::vector<Interval> res;
    for (const Interval& i : _intervals) {
        Number lb = i.lb();
        for (const Interval& o : other._intervals) {
            if (o.ub() < lb || o.lb() > i.ub()) {
                continue;
            }
            if (o.lb() > lb) {
                res.emplace_back(lb, o.lb() - 1);
            }
            lb = o.ub() + 1;
            if (lb > i.ub()) {
                break;
            }
        }
        if (lb <= i.ub()) {
            res.emplace_back(lb, i.ub());
        }
    }
    return RangeSet{std::move(res)};
}

RangeSet RangeSet::hull() const {
    if (_intervals.empty()) {
        return {};
    }
    return range(_intervals.front().lb(), _intervals.back().ub());
}

std::size_t hash_value(const RangeSet& r) {
    std::size_t seed = r._intervals.size();
    for (const Interval& i : r._intervals) {
        boost::hash_combine(seed, hash_value(i.lb()));
        boost::hash_combine(seed, hash_value(i.ub()));
    }
    return seed;
}

std::ostream& operator<<(std::ostream& o, const RangeSet& r) {
    if (r.is_empty()) {
        return o << "{}";
    }
    o << "{";
    bool first = true;
    for (const Interval& i : r._intervals) {
        if (!first) {
            o << ", ";
        }
        first = false;
        o << i;
    }
    return o << "}";
}

std::string RangeSet::to_string() const {
    std::ostringstream s;
    s << *this;
    return s.str();
}

} // namespace dftypes

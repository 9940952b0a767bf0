// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: Apache-2.0
#include <sstream>

#include "arith/interval.hpp"

namespace dftypes {

std::ostream& operator<<(std::ostream& o, const Interval& interval) {
    if (interval.is_bottom()) {
        return o << "_|_";
    }
    if (interval.is_singleton()) {
        return o << interval._lb;
    }
    return o << interval._lb << ".." << interval._ub;
}

std::string Interval::to_string() const {
    std::ostringstream s;
    s << *this;
    return s.str();
}

} // namespace dftypes

// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>

namespace dftypes {

struct lattice_options_t {
    // A join producing more disjoint intervals than this is widened to the hull of the union.
    std::size_t max_range_intervals = 16;

    // Keep the widest range observed for integral values so that widen() can jump to it.
    // When false, integral types never carry a wide range.
    bool track_wide_range = true;
};

extern thread_local lattice_options_t thread_local_lattice_options;

} // namespace dftypes

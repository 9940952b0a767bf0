// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#include "dftypes.hpp"

namespace dftypes {

void dftypes_clear_thread_local_state() {
    thread_local_lattice_options = {};
    thread_local_type_hierarchy.clear();
}

} // namespace dftypes

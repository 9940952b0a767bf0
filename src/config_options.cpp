// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#include "config_options.hpp"

namespace dftypes {
thread_local lattice_options_t thread_local_lattice_options;
} // namespace dftypes

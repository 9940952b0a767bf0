// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include "config_options.hpp"
#include "domains/df_type.hpp"
#include "domains/df_types.hpp"
#include "types/type_constraint.hpp"
#include "types/type_hierarchy.hpp"
#include "utils/antichain.hpp"

namespace dftypes {

// Resets the options and the type hierarchy of the current thread.
void dftypes_clear_thread_local_state();

struct ThreadLocalGuard {
    ThreadLocalGuard() = default;
    ~ThreadLocalGuard() { dftypes_clear_thread_local_state(); }
};

} // namespace dftypes

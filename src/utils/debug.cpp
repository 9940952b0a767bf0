// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#include "utils/debug.hpp"

namespace dftypes {
bool DfTypesLogFlag = false;
std::set<std::string> DfTypesLog;

bool DfTypesWarningFlag = false;
void DfTypesEnableWarningMsg(const bool b) { DfTypesWarningFlag = b; }

} // namespace dftypes

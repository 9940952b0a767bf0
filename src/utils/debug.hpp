// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>

namespace dftypes {

extern bool DfTypesLogFlag;
extern std::set<std::string> DfTypesLog;

inline void DfTypesEnableLog(const std::string& tag) {
    DfTypesLogFlag = true;
    DfTypesLog.insert(tag);
}

#define DFTYPES_LOG(TAG, CODE)                                                         \
    do {                                                                               \
        if (::dftypes::DfTypesLogFlag && ::dftypes::DfTypesLog.contains(TAG)) {        \
            CODE;                                                                      \
        }                                                                              \
    } while (0)

template <typename... ArgTypes>
void ___print___(std::ostream& os, ArgTypes... args) {
    (os << ... << args);
}

#define DFTYPES_ERROR(...)                                                             \
    do {                                                                               \
        std::ostringstream os;                                                         \
        os << "DFTYPES ERROR: ";                                                       \
        ::dftypes::___print___(os, __VA_ARGS__);                                       \
        throw std::runtime_error(os.str());                                            \
    } while (0)

extern bool DfTypesWarningFlag;
void DfTypesEnableWarningMsg(bool b);

#define DFTYPES_WARN(...)                                                              \
    do {                                                                               \
        if (::dftypes::DfTypesWarningFlag) {                                           \
            std::cerr << "DFTYPES WARNING: ";                                          \
            ::dftypes::___print___(std::cerr, __VA_ARGS__);                            \
            std::cerr << "\n";                                                         \
        }                                                                              \
    } while (0)

} // namespace dftypes

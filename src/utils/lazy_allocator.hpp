// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <memory>

namespace dftypes {

/// Holds a T that is only constructed on first access.
/// Meant for thread_local state: the object is built by the thread that uses it and destroyed by clear().
template <typename T, T (*factory)() = nullptr>
class LazyAllocator {
    std::unique_ptr<T> ptr;

  public:
    T& get() {
        if (!ptr) {
            if constexpr (factory != nullptr) {
                ptr = std::make_unique<T>(factory());
            } else {
                ptr = std::make_unique<T>();
            }
        }
        return *ptr;
    }

    void set(T value) { ptr = std::make_unique<T>(std::move(value)); }

    void clear() { ptr.reset(); }

    T& operator*() { return get(); }
    T* operator->() { return &get(); }
};

} // namespace dftypes

// Copyright (c) DfTypes contributors.
// SPDX-License-Identifier: MIT
#pragma once

#include <iterator>
#include <stdexcept>
#include <stop_token>

namespace dftypes {

struct AnalysisCancelled : std::runtime_error {
    AnalysisCancelled() : std::runtime_error("analysis cancelled") {}
};

/// Reduce a poset to its maximal antichain, in place.
///
/// `subsumed(a, b)` is a non-strict partial order meaning "a is subsumed by b". Every item for which
/// some other item subsumes it is erased. The stop token is polled before each comparison; when a stop
/// is requested AnalysisCancelled is thrown and the container is left partially reduced.
///
/// The container must support erase(iterator) returning the next iterator (vector, list, set, ...).
template <typename Container, typename Predicate>
Container& upwards_antichain(Container& poset, Predicate subsumed, const std::stop_token& stop = {}) {
    for (auto left = poset.begin(); left != poset.end();) {
        bool removed = false;
        for (auto right = poset.begin(); right != poset.end(); ++right) {
            if (stop.stop_requested()) {
                throw AnalysisCancelled{};
            }
            if (right != left && subsumed(*left, *right)) {
                left = poset.erase(left);
                removed = true;
                break;
            }
        }
        if (!removed) {
            ++left;
        }
    }
    return poset;
}

} // namespace dftypes

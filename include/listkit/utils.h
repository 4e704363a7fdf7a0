// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file utils.h
/// @brief Helpers shared by the persistent snapshot containers.
///
/// immer::flex_vector has no "find" or "remove_if". These helpers give the
/// snapshot types linear lookup and filtered rebuilds (through a transient,
/// so a rebuild allocates once per chunk instead of once per element).

#pragma once

#include <listkit/listkit_config.h>

#include <immer/flex_vector.hpp>
#include <immer/flex_vector_transient.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace listkit {

/// Position of the first element equal to `value`, or nullopt.
template <typename T>
[[nodiscard]] std::optional<std::size_t> position_of(const immer::flex_vector<T>& list, const T& value) {
    std::size_t pos = 0;
    for (const auto& element : list) {
        if (element == value) {
            return pos;
        }
        ++pos;
    }
    return std::nullopt;
}

/// Copy of `list` without the elements matching `drop`.
template <typename T, typename Pred>
[[nodiscard]] immer::flex_vector<T> remove_if(const immer::flex_vector<T>& list, Pred&& drop) {
    auto kept = immer::flex_vector<T>{}.transient();
    for (const auto& element : list) {
        if (!drop(element)) {
            kept.push_back(element);
        }
    }
    return kept.persistent();
}

/// `list` with `values` spliced in before position `pos`.
template <typename T>
[[nodiscard]] immer::flex_vector<T> splice(const immer::flex_vector<T>& list, std::size_t pos,
                                           const std::vector<T>& values) {
    auto middle = immer::flex_vector<T>{}.transient();
    for (const auto& v : values) {
        middle.push_back(v);
    }
    return list.take(pos) + middle.persistent() + list.drop(pos);
}

/// `list` with `values` appended.
template <typename T>
[[nodiscard]] immer::flex_vector<T> append(const immer::flex_vector<T>& list, const std::vector<T>& values) {
    auto t = list.transient();
    for (const auto& v : values) {
        t.push_back(v);
    }
    return t.persistent();
}

/// Materialize a persistent list as a std::vector.
template <typename T>
[[nodiscard]] std::vector<T> to_vector(const immer::flex_vector<T>& list) {
    return std::vector<T>(list.begin(), list.end());
}

} // namespace listkit

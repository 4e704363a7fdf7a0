// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file concepts.h
/// @brief C++20 Concepts for identifier and sequence constraints in listkit.
///
/// @note Requires C++20 or later.

#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <iterator>
#include <type_traits>

namespace listkit {

// ============================================================
// Identifier Concepts
// ============================================================

/// Concept for section and item identifiers.
/// An identifier is a copyable value with equality and a std::hash
/// specialization; it names an element across old and new states.
template<typename T>
concept Identifier = std::copyable<T> &&
                     std::equality_comparable<T> &&
                     requires(const T& v) {
                         { std::hash<T>{}(v) } -> std::convertible_to<std::size_t>;
                     };

/// Concept for a hash functor usable with a given key type
template<typename H, typename K>
concept KeyHasher = requires(const H& h, const K& k) {
    { h(k) } -> std::convertible_to<std::size_t>;
};

/// Concept for an equality functor usable with a given key type
template<typename E, typename K>
concept KeyEqual = requires(const E& e, const K& a, const K& b) {
    { e(a, b) } -> std::convertible_to<bool>;
};

// ============================================================
// Sequence Concepts
// ============================================================

/// Concept for the ordered key sequences accepted by flat_diff.
/// Satisfied by std::vector and immer::flex_vector / immer::vector.
template<typename S>
concept KeySequence = requires(const S& s, std::size_t i) {
    typename S::value_type;
    { s.size() } -> std::convertible_to<std::size_t>;
    { s[i] } -> std::convertible_to<const typename S::value_type&>;
    s.begin();
    s.end();
};

} // namespace listkit

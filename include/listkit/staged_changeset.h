// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file staged_changeset.h
/// @brief Section-aware edit script handed to the rendering collaborator.
///
/// Apply order expected from the collaborator:
///   1. section_deletes, item_deletes   (old indices)
///   2. section_inserts, item_inserts   (new indices)
///   3. section_moves, item_moves       (old -> new)
///   4. section_reloads, item_reloads, item_reconfigures (new indices)

#pragma once

#include <listkit/api.h>
#include <listkit/flat_diff.h>
#include <listkit/index_path.h>

#include <cstddef>
#include <string>
#include <vector>

namespace listkit {

struct ItemMove {
    IndexPath from; // old position
    IndexPath to;   // new position

    bool operator==(const ItemMove&) const = default;
};

struct LISTKIT_API StagedChangeset {
    // Sections
    std::vector<std::size_t> section_deletes;  // ascending old indices
    std::vector<std::size_t> section_inserts;  // ascending new indices
    std::vector<Move> section_moves;           // ordered by destination
    std::vector<std::size_t> section_reloads;  // ascending new indices

    // Items
    std::vector<IndexPath> item_deletes;       // descending old paths
    std::vector<IndexPath> item_inserts;       // ascending new paths
    std::vector<ItemMove> item_moves;          // ordered by destination
    std::vector<IndexPath> item_reloads;       // ascending new paths
    std::vector<IndexPath> item_reconfigures;  // ascending new paths

    /// True when there is nothing at all to apply, markers included.
    [[nodiscard]] bool empty() const noexcept;

    /// True when any delete, insert or move list is non-empty.
    [[nodiscard]] bool has_structural_changes() const noexcept;

    [[nodiscard]] std::size_t operation_count() const noexcept;

    [[nodiscard]] std::string to_string() const;

    /// Dump to stdout.
    void print() const;

    bool operator==(const StagedChangeset&) const = default;
};

} // namespace listkit

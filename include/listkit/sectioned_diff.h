// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file sectioned_diff.h
/// @brief Snapshot-to-snapshot reconciliation producing a StagedChangeset.
///
/// Steps:
///   1. flat_diff over the section identifiers
///   2. flat_diff over the items of every section present in both snapshots
///   3. pair item deletes with item inserts of the same identity across
///      surviving sections, turning them into cross-section moves
///   4. reduce within-section moves (and section moves) to the ones outside
///      the longest increasing run of old positions
///   5. fold the reload / reconfigure markers of the new snapshot
///
/// Items of a deleted section disappear with the section and items of an
/// inserted section arrive with it; neither is reported per item.

#pragma once

#include <listkit/listkit_config.h>
#include <listkit/flat_diff.h>
#include <listkit/hierarchical_snapshot.h>
#include <listkit/move_filter.h>
#include <listkit/snapshot.h>
#include <listkit/staged_changeset.h>

#include <tsl/robin_map.h>
#include <tsl/robin_set.h>

#include <algorithm>
#include <functional>
#include <optional>
#include <vector>

namespace listkit {

namespace detail {

template <typename SectionID, typename ItemID>
tsl::robin_map<ItemID, IndexPath> item_paths(const Snapshot<SectionID, ItemID>& snapshot) {
    tsl::robin_map<ItemID, IndexPath> paths;
    paths.reserve(snapshot.number_of_items());
    for (std::size_t s = 0; s < snapshot.number_of_sections(); ++s) {
        std::size_t i = 0;
        for (const auto& item : snapshot.items_in_section_at(s)) {
            paths.emplace(item, IndexPath{s, i++});
        }
    }
    return paths;
}

} // namespace detail

template <Identifier SectionID, Identifier ItemID>
[[nodiscard]] StagedChangeset sectioned_diff(const Snapshot<SectionID, ItemID>& old_snapshot,
                                             const Snapshot<SectionID, ItemID>& new_snapshot) {
    StagedChangeset changeset;

    // Sections
    const auto section_diff = flat_diff(old_snapshot.section_identifiers(), new_snapshot.section_identifiers());
    changeset.section_deletes = section_diff.deletes;
    changeset.section_inserts = section_diff.inserts;
    changeset.section_moves = select_minimal_moves(section_diff.matched);

    // Items of surviving sections
    struct Pending {
        ItemID item;
        IndexPath path;
    };
    std::vector<Pending> deletes;
    std::vector<Pending> inserts;

    for (const auto& match : section_diff.matched) {
        const auto old_items = old_snapshot.items_in_section_at(match.old_index);
        const auto new_items = new_snapshot.items_in_section_at(match.new_index);
        if (old_items == new_items) {
            continue;
        }
        const auto d = flat_diff(old_items, new_items);
        for (auto idx : d.deletes) {
            deletes.push_back(Pending{old_items[idx], IndexPath{match.old_index, idx}});
        }
        for (auto idx : d.inserts) {
            inserts.push_back(Pending{new_items[idx], IndexPath{match.new_index, idx}});
        }
        for (const auto& m : select_minimal_moves(d.matched)) {
            changeset.item_moves.push_back(
                ItemMove{IndexPath{match.old_index, m.from}, IndexPath{match.new_index, m.to}});
        }
    }

    // Cross-section moves
    if (!deletes.empty() && !inserts.empty() && section_diff.matched.size() > 1) {
        tsl::robin_map<ItemID, std::size_t> deleted_at;
        deleted_at.reserve(deletes.size());
        for (std::size_t k = 0; k < deletes.size(); ++k) {
            deleted_at.emplace(deletes[k].item, k);
        }
        std::vector<bool> paired(deletes.size(), false);
        std::vector<Pending> still_inserted;
        still_inserted.reserve(inserts.size());
        for (const auto& ins : inserts) {
            auto it = deleted_at.find(ins.item);
            if (it == deleted_at.end()) {
                still_inserted.push_back(ins);
                continue;
            }
            paired[it->second] = true;
            changeset.item_moves.push_back(ItemMove{deletes[it->second].path, ins.path});
            deleted_at.erase(it);
        }
        std::vector<Pending> still_deleted;
        still_deleted.reserve(deletes.size());
        for (std::size_t k = 0; k < deletes.size(); ++k) {
            if (!paired[k]) {
                still_deleted.push_back(deletes[k]);
            }
        }
        deletes = std::move(still_deleted);
        inserts = std::move(still_inserted);
    }

    for (const auto& d : deletes) {
        changeset.item_deletes.push_back(d.path);
    }
    for (const auto& i : inserts) {
        changeset.item_inserts.push_back(i.path);
    }

    std::sort(changeset.item_deletes.begin(), changeset.item_deletes.end(), std::greater<>{});
    std::sort(changeset.item_inserts.begin(), changeset.item_inserts.end());
    std::sort(changeset.item_moves.begin(), changeset.item_moves.end(),
              [](const ItemMove& a, const ItemMove& b) { return a.to < b.to; });

    // Markers: only elements present on both sides are refreshed; inserted
    // ones are rendered fresh anyway.
    for (const auto& section : new_snapshot.reloaded_section_identifiers()) {
        const auto new_index = new_snapshot.index_of_section(section);
        if (new_index && old_snapshot.contains_section(section)) {
            changeset.section_reloads.push_back(*new_index);
        }
    }
    std::sort(changeset.section_reloads.begin(), changeset.section_reloads.end());

    const auto& reloads = new_snapshot.reloaded_item_identifiers();
    const auto& reconfigures = new_snapshot.reconfigured_item_identifiers();
    if (!reloads.empty() || !reconfigures.empty()) {
        const auto new_paths = detail::item_paths(new_snapshot);
        const auto old_paths = detail::item_paths(old_snapshot);
        auto collect = [&](const auto& marked, std::vector<IndexPath>& out) {
            for (const auto& item : marked) {
                auto it = new_paths.find(item);
                if (it != new_paths.end() && old_paths.count(item)) {
                    out.push_back(it->second);
                }
            }
            std::sort(out.begin(), out.end());
        };
        collect(reloads, changeset.item_reloads);
        collect(reconfigures, changeset.item_reconfigures);
    }

    return changeset;
}

/// Copy of `snapshot` whose `section` holds the visible items of `tree`.
/// nullopt when `section` does not exist.
template <Identifier SectionID, Identifier ItemID>
[[nodiscard]] std::optional<Snapshot<SectionID, ItemID>> flatten_into(const Snapshot<SectionID, ItemID>& snapshot,
                                                                      const SectionID& section,
                                                                      const HierarchicalSnapshot<ItemID>& tree) {
    if (!snapshot.contains_section(section)) {
        return std::nullopt;
    }
    Snapshot<SectionID, ItemID> out = snapshot;
    out.delete_items(to_vector(out.item_identifiers(section)));
    out.append_items(tree.visible_items(), section);
    return out;
}

/// Items of `new_snapshot` that match an item of `old_snapshot` by identity
/// while `content_equal(old_item, new_item)` is false. Feed the result to
/// Snapshot::reconfigure_items.
template <Identifier SectionID, Identifier ItemID, typename ContentEqual>
[[nodiscard]] std::vector<ItemID> items_to_reconfigure(const Snapshot<SectionID, ItemID>& old_snapshot,
                                                       const Snapshot<SectionID, ItemID>& new_snapshot,
                                                       ContentEqual&& content_equal) {
    std::vector<ItemID> changed;
    if (old_snapshot.number_of_items() == 0 || new_snapshot.number_of_items() == 0) {
        return changed;
    }
    const auto previous = old_snapshot.item_identifiers();
    tsl::robin_set<ItemID> old_items(previous.begin(), previous.end());
    for (std::size_t s = 0; s < new_snapshot.number_of_sections(); ++s) {
        for (const auto& item : new_snapshot.items_in_section_at(s)) {
            auto it = old_items.find(item);
            if (it != old_items.end() && !content_equal(*it, item)) {
                changed.push_back(item);
            }
        }
    }
    return changed;
}

} // namespace listkit

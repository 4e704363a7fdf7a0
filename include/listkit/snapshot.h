// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file snapshot.h
/// @brief Ordered, sectioned, keyed collection describing one list state.
///
/// A Snapshot is a value: sections in render order, each owning an ordered
/// list of item identifiers. All storage is persistent (immer), so copying a
/// snapshot is O(1) and a copy that is then mutated shares structure with the
/// original.
///
/// Invariant: an item identifier appears in at most one section. Breaking it
/// is a programmer error that is only detected opportunistically (debug
/// builds, and only while the reverse index happens to be built).
///
/// Usage:
/// @code
///   Snapshot<std::string, int> s;
///   s.append_sections({"inbox", "archive"});
///   s.append_items({1, 2, 3}, "inbox");
///   s.append_items({4});                 // goes to the last section
///   s.move_item_before(4, 1);            // cross-section move
///   auto where = s.index_path(4);        // IndexPath{0, 0}
/// @endcode

#pragma once

#include <listkit/listkit_config.h>
#include <listkit/concepts.h>
#include <listkit/errors.h>
#include <listkit/index_path.h>
#include <listkit/utils.h>

#include <immer/flex_vector.hpp>
#include <immer/flex_vector_transient.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/set.hpp>

#include <tsl/robin_set.h>

#include <cstddef>
#include <optional>
#include <vector>

namespace listkit {

namespace detail {

enum class IndexState { Absent, Building, Present };

/// Lazily built item -> section lookup.
///
/// Building the index costs O(total items); most snapshots are built with
/// appends and handed straight to the diff, which never needs a reverse
/// lookup. So the index is only built by the first operation that needs O(1)
/// item -> section resolution (insert/move anchored on an item).
///
/// Once present, cheap mutations (append, insert, move, section delete) patch
/// it. A bulk item delete instead drops it back to Absent: removing an
/// arbitrary number of keys from the hash trie costs about as much as the
/// O(n) rebuild, and the rebuild is only paid if another anchored mutation
/// follows.
template <typename ItemID, typename SectionID>
class ReverseIndex {
public:
    [[nodiscard]] IndexState state() const noexcept { return state_; }
    [[nodiscard]] bool present() const noexcept { return state_ == IndexState::Present; }

    void invalidate() noexcept {
        state_ = IndexState::Absent;
        map_ = {};
    }

    /// `fill(emit)` must call `emit(item, section)` for every item.
    template <typename Fill>
    void build(Fill&& fill) {
        if (state_ == IndexState::Present) {
            return;
        }
        LISTKIT_ASSERT(state_ != IndexState::Building, "reverse index built re-entrantly");
        state_ = IndexState::Building;
        auto t = immer::map<ItemID, SectionID>{}.transient();
        fill([&t](const ItemID& item, const SectionID& section) {
            [[maybe_unused]] const auto before = t.size();
            t.set(item, section);
            LISTKIT_ASSERT(t.size() != before, "item identifier appears more than once in the snapshot");
        });
        map_ = t.persistent();
        state_ = IndexState::Present;
    }

    [[nodiscard]] const SectionID* find(const ItemID& item) const {
        return present() ? map_.find(item) : nullptr;
    }

    void assign(const ItemID& item, const SectionID& section) {
        if (present()) {
            map_ = map_.set(item, section);
        }
    }

    void erase(const ItemID& item) {
        if (present()) {
            map_ = map_.erase(item);
        }
    }

private:
    IndexState state_ = IndexState::Absent;
    immer::map<ItemID, SectionID> map_;
};

} // namespace detail

template <Identifier SectionID, Identifier ItemID>
class Snapshot {
public:
    using section_type = SectionID;
    using item_type = ItemID;
    using SectionList = immer::flex_vector<SectionID>;
    using ItemList = immer::flex_vector<ItemID>;

    Snapshot() = default;

    // ========================================================================
    // Section mutations
    // ========================================================================

    void append_sections(const std::vector<SectionID>& ids) {
        auto sections = sections_.transient();
        auto items = section_items_.transient();
        for (const auto& id : ids) {
            if (section_index_.count(id)) {
                LISTKIT_ASSERT(false, "section identifier already exists");
                continue;
            }
            section_index_ = section_index_.set(id, sections.size());
            sections.push_back(id);
            items.push_back(ItemList{});
        }
        sections_ = sections.persistent();
        section_items_ = items.persistent();
    }

    void insert_sections_before(const std::vector<SectionID>& ids, const SectionID& before) {
        if (const auto* idx = section_index_.find(before)) {
            insert_sections_at(ids, *idx);
        }
    }

    void insert_sections_after(const std::vector<SectionID>& ids, const SectionID& after) {
        if (const auto* idx = section_index_.find(after)) {
            insert_sections_at(ids, *idx + 1);
        }
    }

    /// Removes the sections and every item they own. Absent ids are ignored.
    void delete_sections(const std::vector<SectionID>& ids) {
        tsl::robin_set<SectionID> doomed;
        for (const auto& id : ids) {
            if (section_index_.count(id)) {
                doomed.insert(id);
            }
        }
        if (doomed.empty()) {
            return;
        }

        auto sections = SectionList{}.transient();
        auto items = immer::flex_vector<ItemList>{}.transient();
        for (std::size_t s = 0; s < sections_.size(); ++s) {
            if (doomed.count(sections_[s])) {
                const auto& removed = section_items_[s];
                item_count_ -= removed.size();
                for (const auto& item : removed) {
                    reverse_index_.erase(item);
                }
                continue;
            }
            sections.push_back(sections_[s]);
            items.push_back(section_items_[s]);
        }
        sections_ = sections.persistent();
        section_items_ = items.persistent();
        rebuild_section_index();
    }

    bool move_section_before(const SectionID& id, const SectionID& before) {
        return move_section(id, before, false);
    }

    bool move_section_after(const SectionID& id, const SectionID& after) {
        return move_section(id, after, true);
    }

    void reload_sections(const std::vector<SectionID>& ids) {
        for (const auto& id : ids) {
            reloaded_sections_ = reloaded_sections_.insert(id);
        }
    }

    // ========================================================================
    // Item mutations
    // ========================================================================

    /// Appends to the last section.
    /// @throws precondition_error when the snapshot has no section
    void append_items(const std::vector<ItemID>& ids) {
        if (sections_.empty()) {
            throw precondition_error("Snapshot::append_items: no section to append to");
        }
        append_items_at(ids, sections_.size() - 1);
    }

    /// @throws precondition_error when `section` does not exist
    void append_items(const std::vector<ItemID>& ids, const SectionID& section) {
        const auto* idx = section_index_.find(section);
        if (!idx) {
            throw precondition_error("Snapshot::append_items: section does not exist");
        }
        append_items_at(ids, *idx);
    }

    void insert_items_before(const std::vector<ItemID>& ids, const ItemID& before) {
        insert_items_anchored(ids, before, false);
    }

    void insert_items_after(const std::vector<ItemID>& ids, const ItemID& after) {
        insert_items_anchored(ids, after, true);
    }

    /// Scans the section lists directly instead of resolving through the
    /// reverse index, then invalidates the index (see ReverseIndex).
    void delete_items(const std::vector<ItemID>& ids) {
        if (ids.empty()) {
            return;
        }
        tsl::robin_set<ItemID> doomed(ids.begin(), ids.end());
        std::size_t remaining = doomed.size();

        for (std::size_t s = 0; s < section_items_.size() && remaining > 0; ++s) {
            const auto& list = section_items_[s];
            auto kept = remove_if(list, [&](const ItemID& item) { return doomed.count(item) != 0; });
            const std::size_t removed = list.size() - kept.size();
            if (removed == 0) {
                continue;
            }
            section_items_ = section_items_.set(s, std::move(kept));
            item_count_ -= removed;
            remaining -= removed < remaining ? removed : remaining;
        }
        reverse_index_.invalidate();
    }

    void delete_all_items() {
        auto items = immer::flex_vector<ItemList>{}.transient();
        for (std::size_t s = 0; s < sections_.size(); ++s) {
            items.push_back(ItemList{});
        }
        section_items_ = items.persistent();
        item_count_ = 0;
        reverse_index_.invalidate();
    }

    /// Moves `id` in front of `before`, across sections if needed.
    /// Both items and their positions are resolved before anything is
    /// removed; when either is missing the snapshot is left untouched.
    /// @return true iff the snapshot changed
    bool move_item_before(const ItemID& id, const ItemID& before) {
        return move_item(id, before, false);
    }

    bool move_item_after(const ItemID& id, const ItemID& after) {
        return move_item(id, after, true);
    }

    void reload_items(const std::vector<ItemID>& ids) {
        for (const auto& id : ids) {
            reloaded_items_ = reloaded_items_.insert(id);
        }
    }

    void reconfigure_items(const std::vector<ItemID>& ids) {
        for (const auto& id : ids) {
            reconfigured_items_ = reconfigured_items_.insert(id);
        }
    }

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] const SectionList& section_identifiers() const noexcept { return sections_; }
    [[nodiscard]] std::size_t number_of_sections() const noexcept { return sections_.size(); }
    [[nodiscard]] std::size_t number_of_items() const noexcept { return item_count_; }

    [[nodiscard]] std::size_t number_of_items(const SectionID& section) const {
        const auto* idx = section_index_.find(section);
        return idx ? section_items_[*idx].size() : 0;
    }

    [[nodiscard]] std::size_t number_of_items_in_section_at(std::size_t section_index) const {
        return section_index < section_items_.size() ? section_items_[section_index].size() : 0;
    }

    /// All items in render order.
    [[nodiscard]] std::vector<ItemID> item_identifiers() const {
        std::vector<ItemID> out;
        out.reserve(item_count_);
        for (const auto& list : section_items_) {
            out.insert(out.end(), list.begin(), list.end());
        }
        return out;
    }

    /// Items of `section`; empty when the section does not exist.
    [[nodiscard]] ItemList item_identifiers(const SectionID& section) const {
        const auto* idx = section_index_.find(section);
        return idx ? section_items_[*idx] : ItemList{};
    }

    [[nodiscard]] ItemList items_in_section_at(std::size_t section_index) const {
        return section_index < section_items_.size() ? section_items_[section_index] : ItemList{};
    }

    [[nodiscard]] std::optional<ItemID> item_identifier(std::size_t section_index, std::size_t item_index) const {
        if (section_index >= section_items_.size()) {
            return std::nullopt;
        }
        const auto& list = section_items_[section_index];
        if (item_index >= list.size()) {
            return std::nullopt;
        }
        return list[item_index];
    }

    [[nodiscard]] std::optional<ItemID> item_identifier(const IndexPath& path) const {
        return item_identifier(path.section, path.item);
    }

    /// Section owning `item`. Uses the reverse index when it is already
    /// built; otherwise scans instead of forcing a build for one query.
    [[nodiscard]] std::optional<SectionID> section_identifier(const ItemID& item) const {
        if (reverse_index_.present()) {
            if (const auto* section = reverse_index_.find(item)) {
                return *section;
            }
            return std::nullopt;
        }
        for (std::size_t s = 0; s < section_items_.size(); ++s) {
            if (position_of(section_items_[s], item)) {
                return sections_[s];
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<SectionID> section_identifier_at(std::size_t section_index) const {
        if (section_index >= sections_.size()) {
            return std::nullopt;
        }
        return sections_[section_index];
    }

    /// Position of `item` in the flattened render order.
    [[nodiscard]] std::optional<std::size_t> index_of_item(const ItemID& item) const {
        std::size_t offset = 0;
        for (const auto& list : section_items_) {
            if (auto pos = position_of(list, item)) {
                return offset + *pos;
            }
            offset += list.size();
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<std::size_t> index_of_section(const SectionID& section) const {
        if (const auto* idx = section_index_.find(section)) {
            return *idx;
        }
        return std::nullopt;
    }

    [[nodiscard]] std::optional<IndexPath> index_path(const ItemID& item) const {
        if (reverse_index_.present()) {
            const auto* section = reverse_index_.find(item);
            if (!section) {
                return std::nullopt;
            }
            const std::size_t s = *section_index_.find(*section);
            if (auto pos = position_of(section_items_[s], item)) {
                return IndexPath{s, *pos};
            }
            return std::nullopt;
        }
        for (std::size_t s = 0; s < section_items_.size(); ++s) {
            if (auto pos = position_of(section_items_[s], item)) {
                return IndexPath{s, *pos};
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] bool contains_section(const SectionID& section) const { return section_index_.count(section) != 0; }
    [[nodiscard]] bool contains_item(const ItemID& item) const { return section_identifier(item).has_value(); }

    [[nodiscard]] const immer::set<ItemID>& reloaded_item_identifiers() const noexcept { return reloaded_items_; }
    [[nodiscard]] const immer::set<ItemID>& reconfigured_item_identifiers() const noexcept { return reconfigured_items_; }
    [[nodiscard]] const immer::set<SectionID>& reloaded_section_identifiers() const noexcept { return reloaded_sections_; }

    [[nodiscard]] bool has_markers() const noexcept {
        return !reloaded_items_.empty() || !reconfigured_items_.empty() || !reloaded_sections_.empty();
    }

    /// Copy with the reload / reconfigure sets emptied.
    [[nodiscard]] Snapshot clearing_markers() const {
        Snapshot copy = *this;
        copy.reloaded_items_ = {};
        copy.reconfigured_items_ = {};
        copy.reloaded_sections_ = {};
        return copy;
    }

    [[nodiscard]] detail::IndexState reverse_index_state() const noexcept { return reverse_index_.state(); }

private:
    void rebuild_section_index() {
        auto t = immer::map<SectionID, std::size_t>{}.transient();
        for (std::size_t s = 0; s < sections_.size(); ++s) {
            t.set(sections_[s], s);
        }
        section_index_ = t.persistent();
    }

    void ensure_reverse_index() {
        reverse_index_.build([this](auto&& emit) {
            for (std::size_t s = 0; s < sections_.size(); ++s) {
                for (const auto& item : section_items_[s]) {
                    emit(item, sections_[s]);
                }
            }
        });
    }

    void insert_sections_at(const std::vector<SectionID>& ids, std::size_t pos) {
        std::vector<SectionID> fresh;
        fresh.reserve(ids.size());
        for (const auto& id : ids) {
            if (section_index_.count(id)) {
                LISTKIT_ASSERT(false, "section identifier already exists");
                continue;
            }
            fresh.push_back(id);
        }
        if (fresh.empty()) {
            return;
        }
        sections_ = splice(sections_, pos, fresh);
        section_items_ = splice(section_items_, pos, std::vector<ItemList>(fresh.size()));
        rebuild_section_index();
    }

    bool move_section(const SectionID& id, const SectionID& anchor, bool after) {
        const auto* from_ptr = section_index_.find(id);
        const auto* to_ptr = section_index_.find(anchor);
        if (!from_ptr || !to_ptr || *from_ptr == *to_ptr) {
            return false;
        }
        const std::size_t from = *from_ptr;
        const std::size_t to = *to_ptr;
        const ItemList items = section_items_[from];

        sections_ = sections_.erase(from);
        section_items_ = section_items_.erase(from);

        std::size_t dest = from < to ? to - 1 : to;
        if (after) {
            ++dest;
        }
        sections_ = sections_.take(dest).push_back(id) + sections_.drop(dest);
        section_items_ = section_items_.take(dest).push_back(items) + section_items_.drop(dest);
        rebuild_section_index();
        return true;
    }

    void check_new_items([[maybe_unused]] const std::vector<ItemID>& ids) const {
#if LISTKIT_ENABLE_DUPLICATE_CHECKS
        if (ids.size() > 1) {
            tsl::robin_set<ItemID> seen;
            for (const auto& id : ids) {
                LISTKIT_ASSERT(seen.insert(id).second, "duplicate item identifier in one batch");
            }
        }
        if (reverse_index_.present()) {
            for (const auto& id : ids) {
                LISTKIT_ASSERT(reverse_index_.find(id) == nullptr,
                               "item identifier already exists in the snapshot; each item belongs to one section");
            }
        }
#endif
    }

    void append_items_at(const std::vector<ItemID>& ids, std::size_t section_index) {
        check_new_items(ids);
        section_items_ = section_items_.set(section_index, append(section_items_[section_index], ids));
        item_count_ += ids.size();
        if (reverse_index_.present()) {
            const auto& section = sections_[section_index];
            for (const auto& id : ids) {
                reverse_index_.assign(id, section);
            }
        }
    }

    void insert_items_anchored(const std::vector<ItemID>& ids, const ItemID& anchor, bool after) {
        ensure_reverse_index();
        const auto* section = reverse_index_.find(anchor);
        if (!section) {
            return;
        }
        const std::size_t s = *section_index_.find(*section);
        const auto pos = position_of(section_items_[s], anchor);
        if (!pos) {
            return;
        }
        check_new_items(ids);
        section_items_ = section_items_.set(s, splice(section_items_[s], *pos + (after ? 1 : 0), ids));
        item_count_ += ids.size();
        const SectionID owner = *section;
        for (const auto& id : ids) {
            reverse_index_.assign(id, owner);
        }
    }

    bool move_item(const ItemID& id, const ItemID& anchor, bool after) {
        if (id == anchor) {
            return false;
        }
        ensure_reverse_index();
        const auto* from_section = reverse_index_.find(id);
        const auto* to_section = reverse_index_.find(anchor);
        if (!from_section || !to_section) {
            return false;
        }
        const auto* from_s = section_index_.find(*from_section);
        const auto* to_s = section_index_.find(*to_section);
        if (!from_s || !to_s) {
            return false;
        }
        const std::size_t fs = *from_s;
        const std::size_t ts = *to_s;
        const auto from_pos = position_of(section_items_[fs], id);
        const auto anchor_pos = position_of(section_items_[ts], anchor);
        if (!from_pos || !anchor_pos) {
            return false;
        }
        const SectionID destination = *to_section;

        // Destination is validated; now it is safe to remove the source.
        section_items_ = section_items_.set(fs, section_items_[fs].erase(*from_pos));

        std::size_t dest = *anchor_pos;
        if (fs == ts && *from_pos < dest) {
            --dest;
        }
        if (after) {
            ++dest;
        }
        const auto& target = section_items_[ts];
        section_items_ = section_items_.set(ts, target.take(dest).push_back(id) + target.drop(dest));
        reverse_index_.assign(id, destination);
        return true;
    }

    SectionList sections_;
    immer::flex_vector<ItemList> section_items_; // parallel to sections_
    immer::map<SectionID, std::size_t> section_index_;
    std::size_t item_count_ = 0;

    immer::set<ItemID> reloaded_items_;
    immer::set<ItemID> reconfigured_items_;
    immer::set<SectionID> reloaded_sections_;

    detail::ReverseIndex<ItemID, SectionID> reverse_index_;
};

// ============================================================
// Section models
// ============================================================

/// Plain description of one section: identifier plus items in order.
template <typename SectionID, typename ItemID>
struct SectionModel {
    SectionID id;
    std::vector<ItemID> items;
};

template <Identifier SectionID, Identifier ItemID>
[[nodiscard]] Snapshot<SectionID, ItemID> make_snapshot(const std::vector<SectionModel<SectionID, ItemID>>& sections) {
    Snapshot<SectionID, ItemID> snapshot;
    for (const auto& section : sections) {
        snapshot.append_sections({section.id});
        snapshot.append_items(section.items, section.id);
    }
    return snapshot;
}

} // namespace listkit

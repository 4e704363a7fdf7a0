// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file hierarchical_snapshot.h
/// @brief Tree of keyed items with expand / collapse visibility.
///
/// Items are kept in one depth-first list; a node's subtree is always the
/// contiguous run that starts at the node. Parent and child links live in
/// persistent maps next to that list. Collapsing a node hides its
/// descendants from visible_items() without touching the depth-first list.
///
/// Usage:
/// @code
///   HierarchicalSnapshot<std::string> tree;
///   tree.append({"A"});
///   tree.expand({"A"});
///   tree.append({"B", "C"}, "A");
///   tree.visible_items();   // [A, B, C]
///   tree.collapse({"A"});
///   tree.visible_items();   // [A]
///   tree.items();           // [A, B, C]
/// @endcode

#pragma once

#include <listkit/listkit_config.h>
#include <listkit/concepts.h>
#include <listkit/utils.h>

#include <immer/flex_vector.hpp>
#include <immer/flex_vector_transient.hpp>
#include <immer/map.hpp>
#include <immer/set.hpp>

#include <tsl/robin_set.h>

#include <cstddef>
#include <optional>
#include <vector>

namespace listkit {

template <Identifier ItemID>
class HierarchicalSnapshot {
public:
    using item_type = ItemID;
    using ItemList = immer::flex_vector<ItemID>;

    HierarchicalSnapshot() = default;

    // ========================================================================
    // Mutations
    // ========================================================================

    /// Append root items.
    void append(const std::vector<ItemID>& ids) {
        check_new_items(ids);
        items_ = listkit::append(items_, ids);
        roots_ = listkit::append(roots_, ids);
    }

    /// Append `ids` as the last children of `parent`. They land right after
    /// the parent's current subtree. No-op when `parent` is absent.
    void append(const std::vector<ItemID>& ids, const ItemID& parent) {
        const auto parent_pos = index_of(parent);
        if (!parent_pos || ids.empty()) {
            return;
        }
        check_new_items(ids);
        items_ = splice(items_, *parent_pos + subtree_size(parent), ids);
        const auto* existing = children_.find(parent);
        children_ = children_.set(parent, listkit::append(existing ? *existing : ItemList{}, ids));
        for (const auto& id : ids) {
            parent_ = parent_.set(id, parent);
        }
    }

    /// Insert `ids` as siblings in front of `sibling`. No-op when absent.
    void insert_before(const std::vector<ItemID>& ids, const ItemID& sibling) {
        const auto pos = index_of(sibling);
        if (!pos || ids.empty()) {
            return;
        }
        check_new_items(ids);
        items_ = splice(items_, *pos, ids);
        insert_siblings(ids, sibling, false);
    }

    /// Insert `ids` as siblings behind `sibling` and its whole subtree.
    void insert_after(const std::vector<ItemID>& ids, const ItemID& sibling) {
        const auto pos = index_of(sibling);
        if (!pos || ids.empty()) {
            return;
        }
        check_new_items(ids);
        items_ = splice(items_, *pos + subtree_size(sibling), ids);
        insert_siblings(ids, sibling, true);
    }

    /// Remove every listed item together with its subtree.
    void delete_items(const std::vector<ItemID>& ids) {
        tsl::robin_set<ItemID> doomed;
        for (const auto& id : ids) {
            if (!contains(id) || doomed.count(id)) {
                continue;
            }
            collect_subtree(id, doomed);
        }
        if (doomed.empty()) {
            return;
        }

        // Detach the top-most removed nodes from surviving parents.
        for (const auto& id : ids) {
            if (!doomed.count(id)) {
                continue;
            }
            if (const auto* p = parent_.find(id)) {
                if (doomed.count(*p)) {
                    continue;
                }
                const ItemID owner = *p;
                auto siblings = remove_if(children_[owner], [&](const ItemID& c) { return doomed.count(c) != 0; });
                children_ = siblings.empty() ? children_.erase(owner) : children_.set(owner, siblings);
            }
        }
        roots_ = remove_if(roots_, [&](const ItemID& r) { return doomed.count(r) != 0; });

        items_ = remove_if(items_, [&](const ItemID& item) { return doomed.count(item) != 0; });
        for (const auto& id : doomed) {
            parent_ = parent_.erase(id);
            children_ = children_.erase(id);
            expanded_ = expanded_.erase(id);
        }
    }

    void expand(const std::vector<ItemID>& ids) {
        for (const auto& id : ids) {
            if (contains(id)) {
                expanded_ = expanded_.insert(id);
            }
        }
    }

    void collapse(const std::vector<ItemID>& ids) {
        for (const auto& id : ids) {
            expanded_ = expanded_.erase(id);
        }
    }

    // ========================================================================
    // Queries
    // ========================================================================

    /// Depth-first list of every item, visible or not.
    [[nodiscard]] const ItemList& items() const noexcept { return items_; }
    [[nodiscard]] const ItemList& root_items() const noexcept { return roots_; }
    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] bool empty() const noexcept { return items_.empty(); }

    [[nodiscard]] bool contains(const ItemID& item) const {
        return parent_.count(item) != 0 || position_of(roots_, item).has_value();
    }

    [[nodiscard]] std::optional<std::size_t> index_of(const ItemID& item) const { return position_of(items_, item); }

    [[nodiscard]] std::optional<ItemID> parent(const ItemID& item) const {
        if (const auto* p = parent_.find(item)) {
            return *p;
        }
        return std::nullopt;
    }

    [[nodiscard]] ItemList children(const ItemID& item) const {
        const auto* c = children_.find(item);
        return c ? *c : ItemList{};
    }

    /// Distance to the root (roots are level 0); nullopt when absent.
    [[nodiscard]] std::optional<std::size_t> level(const ItemID& item) const {
        if (!contains(item)) {
            return std::nullopt;
        }
        std::size_t depth = 0;
        const auto* p = parent_.find(item);
        while (p) {
            ++depth;
            p = parent_.find(*p);
        }
        return depth;
    }

    [[nodiscard]] bool is_expanded(const ItemID& item) const { return expanded_.count(item) != 0; }

    /// True iff `item` exists and every ancestor is expanded.
    [[nodiscard]] bool is_visible(const ItemID& item) const {
        if (!contains(item)) {
            return false;
        }
        const auto* p = parent_.find(item);
        while (p) {
            if (!expanded_.count(*p)) {
                return false;
            }
            p = parent_.find(*p);
        }
        return true;
    }

    /// Items reachable from a root through expanded ancestors only, in
    /// depth-first order. One pass: a parent always precedes its children,
    /// so "parent is visible and expanded" is known when the child is reached.
    [[nodiscard]] std::vector<ItemID> visible_items() const {
        std::vector<ItemID> out;
        out.reserve(items_.size());
        tsl::robin_set<ItemID> open;
        for (const auto& item : items_) {
            const auto* p = parent_.find(item);
            if (p && !open.count(*p)) {
                continue;
            }
            out.push_back(item);
            if (expanded_.count(item)) {
                open.insert(item);
            }
        }
        return out;
    }

    /// Copy of the subtree below `item`. By default its children are the
    /// roots; with `including_parent` the item itself is the single root.
    /// Parent links pointing outside the copied subtree are dropped.
    [[nodiscard]] HierarchicalSnapshot snapshot_of(const ItemID& item, bool including_parent = false) const {
        HierarchicalSnapshot out;
        const auto pos = index_of(item);
        if (!pos) {
            return out;
        }
        const std::size_t count = subtree_size(item);
        const std::size_t first = including_parent ? *pos : *pos + 1;
        const std::size_t last = *pos + count;

        auto list = items_.drop(first).take(last - first);
        tsl::robin_set<ItemID> kept(list.begin(), list.end());

        out.items_ = list;
        for (const auto& id : list) {
            const auto* p = parent_.find(id);
            if (p && kept.count(*p)) {
                out.parent_ = out.parent_.set(id, *p);
            } else {
                out.roots_ = out.roots_.push_back(id);
            }
            if (const auto* c = children_.find(id)) {
                out.children_ = out.children_.set(id, *c);
            }
            if (expanded_.count(id)) {
                out.expanded_ = out.expanded_.insert(id);
            }
        }
        return out;
    }

private:
    /// Node plus all descendants.
    [[nodiscard]] std::size_t subtree_size(const ItemID& item) const {
        std::size_t count = 0;
        std::vector<ItemID> stack{item};
        while (!stack.empty()) {
            const ItemID top = stack.back();
            stack.pop_back();
            ++count;
            if (const auto* c = children_.find(top)) {
                stack.insert(stack.end(), c->begin(), c->end());
            }
        }
        return count;
    }

    void collect_subtree(const ItemID& item, tsl::robin_set<ItemID>& out) const {
        std::vector<ItemID> stack{item};
        while (!stack.empty()) {
            const ItemID top = stack.back();
            stack.pop_back();
            out.insert(top);
            if (const auto* c = children_.find(top)) {
                stack.insert(stack.end(), c->begin(), c->end());
            }
        }
    }

    void insert_siblings(const std::vector<ItemID>& ids, const ItemID& sibling, bool after) {
        if (const auto* p = parent_.find(sibling)) {
            const ItemID owner = *p;
            const auto& siblings = children_[owner];
            const std::size_t at = *position_of(siblings, sibling) + (after ? 1 : 0);
            children_ = children_.set(owner, splice(siblings, at, ids));
            for (const auto& id : ids) {
                parent_ = parent_.set(id, owner);
            }
        } else {
            const std::size_t at = *position_of(roots_, sibling) + (after ? 1 : 0);
            roots_ = splice(roots_, at, ids);
        }
    }

    void check_new_items([[maybe_unused]] const std::vector<ItemID>& ids) const {
#if LISTKIT_ENABLE_DUPLICATE_CHECKS
        for (const auto& id : ids) {
            LISTKIT_ASSERT(!contains(id), "item identifier already exists in the hierarchical snapshot");
        }
#endif
    }

    ItemList items_;                          // depth-first
    ItemList roots_;
    immer::map<ItemID, ItemID> parent_;       // roots have no entry
    immer::map<ItemID, ItemList> children_;   // ordered children, leaves have no entry
    immer::set<ItemID> expanded_;
};

} // namespace listkit

// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file flat_diff.h
/// @brief Identity-matching O(n) diff over two ordered key sequences.
///
/// This is Paul Heckel's six-pass algorithm:
///
///   1. scan `new`, counting occurrences per key in a symbol table
///   2. scan `old`, counting occurrences per key
///   3. link every key that occurs exactly once in both sequences
///   4. expand links forward:  (i, j) linked => try (i + 1, j + 1)
///   5. expand links backward: (i, j) linked => try (i - 1, j - 1)
///   6. collect: unlinked old slots are deletes, unlinked new slots are
///      inserts, linked slots are matches (and moves when the indices differ)
///
/// Duplicate keys are never linked by pass 3. They only get linked when an
/// adjacent unique match expands into them, so among equal candidates the
/// correspondence is positional and otherwise arbitrary. The result is always
/// internally consistent (every old index is deleted or matched exactly once,
/// every new index is inserted or matched exactly once).
///
/// Usage:
/// @code
///   std::vector<int> before{1, 2, 3, 4, 5};
///   std::vector<int> after{2, 4, 6};
///   auto d = listkit::flat_diff(before, after);
///   // d.deletes == {0, 2, 4}, d.inserts == {2}
/// @endcode

#pragma once

#include <listkit/listkit_config.h>
#include <listkit/concepts.h>

#include <tsl/robin_map.h>

#include <cstddef>
#include <functional>
#include <variant>
#include <vector>

namespace listkit {

/// A matched element that changed position: old index -> new index.
struct Move {
    std::size_t from = 0;
    std::size_t to = 0;

    bool operator==(const Move&) const = default;
};

/// An identity match between old and new, moved or not.
struct Match {
    std::size_t old_index = 0;
    std::size_t new_index = 0;

    bool operator==(const Match&) const = default;
};

/// Output of flat_diff.
///
/// - deletes: ascending old indices
/// - inserts: ascending new indices
/// - moves:   matches whose indices differ, ordered by new index
/// - matched: every match, ordered by new index
struct DiffResult {
    std::vector<std::size_t> deletes;
    std::vector<std::size_t> inserts;
    std::vector<Move> moves;
    std::vector<Match> matched;

    [[nodiscard]] bool empty() const noexcept { return deletes.empty() && inserts.empty() && moves.empty(); }
    [[nodiscard]] bool has_changes() const noexcept { return !empty(); }
};

namespace detail {

// ============================================================
// Occurrence counter: zero / exactly one (with index) / many
// ============================================================

namespace counter {
struct Zero {};
struct One {
    std::size_t index;
};
struct Many {};
} // namespace counter

using Counter = std::variant<counter::Zero, counter::One, counter::Many>;

inline void increment(Counter& c, std::size_t index) {
    if (std::holds_alternative<counter::Zero>(c)) {
        c = counter::One{index};
    } else if (std::holds_alternative<counter::One>(c)) {
        c = counter::Many{};
    }
}

struct SymbolEntry {
    Counter old_counter;
    Counter new_counter;
};

// Slot of the OA / NA arrays: either still pointing at the symbol table, or
// linked to an index in the other sequence.
struct SymbolRef {
    std::size_t slot;
};
struct IndexInOther {
    std::size_t index;
};

using ArrayEntry = std::variant<SymbolRef, IndexInOther>;

inline bool unlinked(const ArrayEntry& e) noexcept {
    return std::holds_alternative<SymbolRef>(e);
}

} // namespace detail

/// Compute the edit script turning `old_seq` into `new_seq`.
///
/// @param hash   hash functor for the key type
/// @param equal  equality functor for the key type; two keys are the same
///               identity iff `equal(a, b)`
template <KeySequence Sequence,
          typename Hash = std::hash<typename Sequence::value_type>,
          typename Equal = std::equal_to<typename Sequence::value_type>>
[[nodiscard]] DiffResult flat_diff(const Sequence& old_seq, const Sequence& new_seq,
                                   Hash hash = Hash{}, Equal equal = Equal{})
    requires KeyHasher<Hash, typename Sequence::value_type> && KeyEqual<Equal, typename Sequence::value_type>
{
    using Key = typename Sequence::value_type;
    using detail::ArrayEntry;
    using detail::IndexInOther;
    using detail::SymbolRef;

    const std::size_t old_count = old_seq.size();
    const std::size_t new_count = new_seq.size();

    DiffResult result;
    if (old_count == 0 && new_count == 0) {
        return result;
    }

    std::vector<detail::SymbolEntry> symbols;
    symbols.reserve(old_count + new_count);
    tsl::robin_map<Key, std::size_t, Hash, Equal> table(old_count + new_count, hash, equal);

    auto slot_for = [&](const Key& key) -> std::size_t {
        auto [it, inserted] = table.try_emplace(key, symbols.size());
        if (inserted) {
            symbols.emplace_back();
        }
        return it->second;
    };

    // Pass 1: new
    std::vector<ArrayEntry> na;
    na.reserve(new_count);
    for (std::size_t i = 0; i < new_count; ++i) {
        const std::size_t slot = slot_for(new_seq[i]);
        detail::increment(symbols[slot].new_counter, i);
        na.emplace_back(SymbolRef{slot});
    }

    // Pass 2: old
    std::vector<ArrayEntry> oa;
    oa.reserve(old_count);
    for (std::size_t j = 0; j < old_count; ++j) {
        const std::size_t slot = slot_for(old_seq[j]);
        detail::increment(symbols[slot].old_counter, j);
        oa.emplace_back(SymbolRef{slot});
    }

    // Pass 3: keys unique in both sequences
    for (std::size_t i = 0; i < new_count; ++i) {
        const auto& entry = symbols[std::get<SymbolRef>(na[i]).slot];
        const auto* in_old = std::get_if<detail::counter::One>(&entry.old_counter);
        const auto* in_new = std::get_if<detail::counter::One>(&entry.new_counter);
        if (in_old && in_new && in_new->index == i) {
            na[i] = IndexInOther{in_old->index};
            oa[in_old->index] = IndexInOther{i};
        }
    }

    // Pass 4: forward expansion
    for (std::size_t i = 0; i + 1 < new_count; ++i) {
        const auto* link = std::get_if<IndexInOther>(&na[i]);
        if (!link) {
            continue;
        }
        const std::size_t j = link->index;
        if (j + 1 < old_count && detail::unlinked(na[i + 1]) && detail::unlinked(oa[j + 1]) &&
            equal(new_seq[i + 1], old_seq[j + 1])) {
            na[i + 1] = IndexInOther{j + 1};
            oa[j + 1] = IndexInOther{i + 1};
        }
    }

    // Pass 5: backward expansion
    for (std::size_t i = new_count; i-- > 1;) {
        const auto* link = std::get_if<IndexInOther>(&na[i]);
        if (!link) {
            continue;
        }
        const std::size_t j = link->index;
        if (j > 0 && detail::unlinked(na[i - 1]) && detail::unlinked(oa[j - 1]) &&
            equal(new_seq[i - 1], old_seq[j - 1])) {
            na[i - 1] = IndexInOther{j - 1};
            oa[j - 1] = IndexInOther{i - 1};
        }
    }

    // Pass 6: collect
    result.deletes.reserve(old_count);
    result.inserts.reserve(new_count);
    result.matched.reserve(old_count < new_count ? old_count : new_count);

    for (std::size_t j = 0; j < old_count; ++j) {
        if (detail::unlinked(oa[j])) {
            result.deletes.push_back(j);
        }
    }

    for (std::size_t i = 0; i < new_count; ++i) {
        if (const auto* link = std::get_if<IndexInOther>(&na[i])) {
            result.matched.push_back(Match{link->index, i});
            if (link->index != i) {
                result.moves.push_back(Move{link->index, i});
            }
        } else {
            result.inserts.push_back(i);
        }
    }

    return result;
}

} // namespace listkit

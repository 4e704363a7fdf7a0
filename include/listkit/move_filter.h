/// @file move_filter.h
/// @brief Minimal-move selection via longest increasing subsequence.
///
/// flat_diff reports every match whose index changed as a move. For an
/// animated update most of those elements only shift because something
/// before them was inserted, deleted or moved. The elements whose old indices
/// already form an increasing run (in new order) can stay put; only the rest
/// have to be moved explicitly. Keeping the longest such run minimizes the
/// number of moves.

#pragma once

#include <listkit/api.h>
#include <listkit/flat_diff.h>

#include <cstddef>
#include <vector>

namespace listkit {

/// Positions (ascending) into `sequence` of one longest strictly increasing
/// subsequence. Patience sorting, O(n log n).
[[nodiscard]] LISTKIT_API std::vector<std::size_t> longest_increasing_subsequence(
    const std::vector<std::size_t>& sequence);

/// Reduce a match list (ordered by new index, as produced by flat_diff) to
/// the moves that must be performed explicitly. Matches on the longest run of
/// increasing old indices are dropped; every other match is returned as a
/// move, ordered by destination.
[[nodiscard]] LISTKIT_API std::vector<Move> select_minimal_moves(const std::vector<Match>& matched);

} // namespace listkit

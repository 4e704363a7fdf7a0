// move_filter.cpp - Longest increasing subsequence and minimal move selection

#include <listkit/move_filter.h>

#include <algorithm>
#include <limits>

namespace listkit {

std::vector<std::size_t> longest_increasing_subsequence(const std::vector<std::size_t>& sequence)
{
    constexpr std::size_t none = std::numeric_limits<std::size_t>::max();

    // tails[k]: position of the smallest tail value of an increasing run of
    // length k + 1 seen so far. Values at those positions are increasing.
    std::vector<std::size_t> tails;
    std::vector<std::size_t> predecessor(sequence.size(), none);

    for (std::size_t pos = 0; pos < sequence.size(); ++pos) {
        const std::size_t value = sequence[pos];
        auto it = std::lower_bound(tails.begin(), tails.end(), value,
                                   [&](std::size_t tail_pos, std::size_t v) { return sequence[tail_pos] < v; });
        if (it != tails.begin()) {
            predecessor[pos] = *(it - 1);
        }
        if (it == tails.end()) {
            tails.push_back(pos);
        } else {
            *it = pos;
        }
    }

    std::vector<std::size_t> result(tails.size());
    std::size_t cursor = tails.empty() ? none : tails.back();
    for (std::size_t k = tails.size(); k-- > 0;) {
        result[k] = cursor;
        cursor = predecessor[cursor];
    }
    return result;
}

std::vector<Move> select_minimal_moves(const std::vector<Match>& matched)
{
    std::vector<Move> moves;
    if (matched.empty()) {
        return moves;
    }

    std::vector<std::size_t> old_positions;
    old_positions.reserve(matched.size());
    for (const auto& m : matched) {
        old_positions.push_back(m.old_index);
    }

    const auto stay = longest_increasing_subsequence(old_positions);
    moves.reserve(matched.size() - stay.size());

    std::size_t next_stay = 0;
    for (std::size_t pos = 0; pos < matched.size(); ++pos) {
        if (next_stay < stay.size() && stay[next_stay] == pos) {
            ++next_stay;
            continue;
        }
        moves.push_back(Move{matched[pos].old_index, matched[pos].new_index});
    }
    return moves;
}

} // namespace listkit

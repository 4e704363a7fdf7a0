// test_flat_diff.cpp - Tests for the identity-matching diff

#include <catch2/catch_all.hpp>
#include <listkit/flat_diff.h>

#include <immer/flex_vector.hpp>

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

using namespace listkit;

// ============================================================
// Helper Functions
// ============================================================

namespace {

// Every old index is deleted or matched exactly once, every new index is
// inserted or matched exactly once.
template <typename T>
bool consistent(const std::vector<T>& old_seq, const std::vector<T>& new_seq, const DiffResult& d) {
    std::vector<int> old_seen(old_seq.size(), 0);
    std::vector<int> new_seen(new_seq.size(), 0);
    for (auto j : d.deletes) {
        if (j >= old_seq.size()) return false;
        ++old_seen[j];
    }
    for (auto i : d.inserts) {
        if (i >= new_seq.size()) return false;
        ++new_seen[i];
    }
    for (const auto& m : d.matched) {
        if (m.old_index >= old_seq.size() || m.new_index >= new_seq.size()) return false;
        if (!(old_seq[m.old_index] == new_seq[m.new_index])) return false;
        ++old_seen[m.old_index];
        ++new_seen[m.new_index];
    }
    auto once = [](int n) { return n == 1; };
    return std::all_of(old_seen.begin(), old_seen.end(), once) &&
           std::all_of(new_seen.begin(), new_seen.end(), once);
}

// Rebuild `new` from `old` using only the diff: matched slots take the old
// element, inserted slots take the new one.
template <typename T>
std::vector<T> rebuild(const std::vector<T>& old_seq, const std::vector<T>& new_seq, const DiffResult& d) {
    std::vector<T> out(new_seq.size());
    for (const auto& m : d.matched) {
        out[m.new_index] = old_seq[m.old_index];
    }
    for (auto i : d.inserts) {
        out[i] = new_seq[i];
    }
    return out;
}

} // namespace

// ============================================================
// Seed scenarios
// ============================================================

TEST_CASE("flat_diff from empty inserts everything", "[flat_diff][scenario]") {
    std::vector<int> old_seq;
    std::vector<int> new_seq{1, 2, 3};

    auto d = flat_diff(old_seq, new_seq);
    REQUIRE(d.deletes.empty());
    REQUIRE(d.inserts == std::vector<std::size_t>{0, 1, 2});
    REQUIRE(d.moves.empty());
    REQUIRE(d.matched.empty());
}

TEST_CASE("flat_diff reports a full rotation as three moves", "[flat_diff][scenario]") {
    std::vector<int> old_seq{1, 2, 3};
    std::vector<int> new_seq{3, 1, 2};

    auto d = flat_diff(old_seq, new_seq);
    REQUIRE(d.deletes.empty());
    REQUIRE(d.inserts.empty());
    REQUIRE(d.moves.size() == 3);
    REQUIRE(d.moves[0] == Move{2, 0});
    REQUIRE(d.moves[1] == Move{0, 1});
    REQUIRE(d.moves[2] == Move{1, 2});
    REQUIRE(rebuild(old_seq, new_seq, d) == new_seq);
}

TEST_CASE("flat_diff mixed deletes and inserts", "[flat_diff][scenario]") {
    std::vector<int> old_seq{1, 2, 3, 4, 5};
    std::vector<int> new_seq{2, 4, 6};

    auto d = flat_diff(old_seq, new_seq);
    REQUIRE(d.deletes == std::vector<std::size_t>{0, 2, 4});
    REQUIRE(d.inserts == std::vector<std::size_t>{2});
    REQUIRE(d.matched.size() == 2);
    REQUIRE(d.matched[0] == Match{1, 0});
    REQUIRE(d.matched[1] == Match{3, 1});
    REQUIRE(consistent(old_seq, new_seq, d));
    REQUIRE(rebuild(old_seq, new_seq, d) == new_seq);
}

TEST_CASE("flat_diff tolerates duplicate keys", "[flat_diff][scenario][duplicates]") {
    std::vector<int> old_seq{1, 1, 2};
    std::vector<int> new_seq{1, 2, 1};

    auto d = flat_diff(old_seq, new_seq);
    const auto total = d.deletes.size() + d.inserts.size() + d.moves.size() + d.matched.size();
    REQUIRE(total > 0);
    REQUIRE(consistent(old_seq, new_seq, d));
    REQUIRE(rebuild(old_seq, new_seq, d) == new_seq);
}

// ============================================================
// Properties
// ============================================================

TEST_CASE("flat_diff empty to empty", "[flat_diff][property]") {
    std::vector<std::string> none;
    auto d = flat_diff(none, none);
    REQUIRE(d.empty());
    REQUIRE_FALSE(d.has_changes());
    REQUIRE(d.matched.empty());
}

TEST_CASE("flat_diff of a sequence with itself", "[flat_diff][property]") {
    std::vector<std::string> x{"a", "b", "c", "d"};
    auto d = flat_diff(x, x);
    REQUIRE(d.deletes.empty());
    REQUIRE(d.inserts.empty());
    REQUIRE(d.moves.empty());
    REQUIRE(d.matched.size() == x.size());
    REQUIRE(d.empty());
}

TEST_CASE("flat_diff pure insertion and pure deletion", "[flat_diff][property]") {
    std::vector<int> base{10, 20, 30, 40};
    std::vector<int> grown{5, 10, 20, 25, 30, 40, 45};

    SECTION("Insertion") {
        auto d = flat_diff(base, grown);
        REQUIRE(d.deletes.empty());
        REQUIRE(d.inserts == std::vector<std::size_t>{0, 3, 6});
        REQUIRE(d.matched.size() == base.size());
        REQUIRE(rebuild(base, grown, d) == grown);
    }

    SECTION("Deletion") {
        auto d = flat_diff(grown, base);
        REQUIRE(d.inserts.empty());
        REQUIRE(d.deletes == std::vector<std::size_t>{0, 3, 6});
        REQUIRE(d.matched.size() == base.size());
        REQUIRE(rebuild(grown, base, d) == base);
    }
}

TEST_CASE("flat_diff round-trips through matched and inserted slots", "[flat_diff][property]") {
    const std::vector<std::vector<int>> samples{
        {},
        {1},
        {1, 2, 3, 4, 5, 6},
        {6, 5, 4, 3, 2, 1},
        {2, 4, 6, 8},
        {1, 3, 5, 7, 9, 2},
        {7, 7, 1, 7},
    };
    for (const auto& a : samples) {
        for (const auto& b : samples) {
            auto d = flat_diff(a, b);
            INFO("old size " << a.size() << ", new size " << b.size());
            REQUIRE(consistent(a, b, d));
            REQUIRE(rebuild(a, b, d) == b);
            REQUIRE(d.moves.size() <= std::min(a.size(), b.size()));
        }
    }
}

TEST_CASE("flat_diff expands unique matches into duplicate neighbours", "[flat_diff][expansion]") {
    // "x" is not unique, but sits next to unique anchors on both sides.
    std::vector<std::string> old_seq{"a", "x", "b", "x", "c"};
    std::vector<std::string> new_seq{"a", "x", "b", "x", "c", "d"};

    auto d = flat_diff(old_seq, new_seq);
    REQUIRE(d.deletes.empty());
    REQUIRE(d.inserts == std::vector<std::size_t>{5});
    REQUIRE(d.matched.size() == 5);
    REQUIRE(d.moves.empty());
}

TEST_CASE("flat_diff over persistent vectors", "[flat_diff][immer]") {
    immer::flex_vector<int> old_seq{1, 2, 3};
    immer::flex_vector<int> new_seq = old_seq.push_back(4).erase(0);

    auto d = flat_diff(old_seq, new_seq);
    REQUIRE(d.deletes == std::vector<std::size_t>{0});
    REQUIRE(d.inserts == std::vector<std::size_t>{2});
    REQUIRE(d.moves.size() == 2);
}

TEST_CASE("flat_diff with custom hash and equality", "[flat_diff][custom]") {
    struct CaseInsensitiveHash {
        std::size_t operator()(const std::string& s) const {
            std::string lower = s;
            std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
            return std::hash<std::string>{}(lower);
        }
    };
    struct CaseInsensitiveEqual {
        bool operator()(const std::string& a, const std::string& b) const {
            return a.size() == b.size() &&
                   std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                       return std::tolower(x) == std::tolower(y);
                   });
        }
    };

    std::vector<std::string> old_seq{"Alpha", "beta"};
    std::vector<std::string> new_seq{"BETA", "alpha"};
    auto d = flat_diff(old_seq, new_seq, CaseInsensitiveHash{}, CaseInsensitiveEqual{});
    REQUIRE(d.deletes.empty());
    REQUIRE(d.inserts.empty());
    REQUIRE(d.matched.size() == 2);
    REQUIRE(d.moves.size() == 2);
}

// test_sectioned_diff.cpp - Tests for snapshot reconciliation

#include <catch2/catch_all.hpp>
#include <listkit/sectioned_diff.h>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

using namespace listkit;

using TestSnapshot = Snapshot<std::string, int>;
using Layout = std::vector<std::pair<std::string, std::vector<int>>>;

namespace {

TestSnapshot build(const std::vector<SectionModel<std::string, int>>& sections) {
    return make_snapshot(sections);
}

Layout layout(const TestSnapshot& snapshot) {
    Layout out;
    for (std::size_t s = 0; s < snapshot.number_of_sections(); ++s) {
        out.emplace_back(*snapshot.section_identifier_at(s), to_vector(snapshot.items_in_section_at(s)));
    }
    return out;
}

// Fill `size` slots: pinned values first, then `survivors` in order into the
// free slots. nullopt when pins collide or the slots do not add up.
template <typename T>
std::optional<std::vector<T>> place(std::size_t size, const std::vector<std::pair<std::size_t, T>>& pins,
                                    const std::vector<T>& survivors) {
    std::vector<std::optional<T>> slots(size);
    for (const auto& [at, value] : pins) {
        if (at >= size || slots[at]) return std::nullopt;
        slots[at] = value;
    }
    std::size_t next = 0;
    for (const auto& value : survivors) {
        while (next < size && slots[next]) {
            ++next;
        }
        if (next == size) return std::nullopt;
        slots[next] = value;
    }
    std::vector<T> out;
    for (const auto& slot : slots) {
        if (!slot) return std::nullopt;
        out.push_back(*slot);
    }
    return out;
}

// Play a changeset on `old_snapshot` the way a sectioned list view does:
// section and item deletes and move sources leave first, then inserts and
// move destinations are pinned at their new positions, and whatever did not
// move fills the remaining slots in its old order. Inserted sections arrive
// with the items `new_snapshot` gives them.
std::optional<Layout> replay(const TestSnapshot& old_snapshot, const TestSnapshot& new_snapshot,
                             const StagedChangeset& changes) {
    const Layout before = layout(old_snapshot);
    const std::size_t section_count = new_snapshot.number_of_sections();

    // Sections, tracked by old index; inserted ones by a sentinel.
    constexpr std::size_t arrived = static_cast<std::size_t>(-1);
    std::vector<bool> section_leaves(before.size(), false);
    for (auto j : changes.section_deletes) {
        if (j >= before.size()) return std::nullopt;
        section_leaves[j] = true;
    }
    std::vector<std::pair<std::size_t, std::size_t>> section_pins;
    for (auto i : changes.section_inserts) {
        section_pins.emplace_back(i, arrived);
    }
    for (const auto& m : changes.section_moves) {
        if (m.from >= before.size()) return std::nullopt;
        section_leaves[m.from] = true;
        section_pins.emplace_back(m.to, m.from);
    }
    std::vector<std::size_t> section_survivors;
    for (std::size_t j = 0; j < before.size(); ++j) {
        if (!section_leaves[j]) {
            section_survivors.push_back(j);
        }
    }
    const auto origin = place(section_count, section_pins, section_survivors);
    if (!origin) return std::nullopt;

    Layout after;
    for (std::size_t s = 0; s < section_count; ++s) {
        const std::size_t from = (*origin)[s];
        if (from == arrived) {
            after.emplace_back(*new_snapshot.section_identifier_at(s), to_vector(new_snapshot.items_in_section_at(s)));
            continue;
        }
        const auto& [id, old_items] = before[from];

        std::vector<bool> leaves(old_items.size(), false);
        for (const auto& path : changes.item_deletes) {
            if (path.section == from) {
                if (path.item >= old_items.size()) return std::nullopt;
                leaves[path.item] = true;
            }
        }
        std::vector<std::pair<std::size_t, int>> pins;
        for (const auto& m : changes.item_moves) {
            if (m.from.section >= before.size() || m.from.item >= before[m.from.section].second.size()) {
                return std::nullopt;
            }
            if (m.from.section == from) {
                leaves[m.from.item] = true;
            }
            if (m.to.section == s) {
                pins.emplace_back(m.to.item, before[m.from.section].second[m.from.item]);
            }
        }
        const auto new_items = to_vector(new_snapshot.items_in_section_at(s));
        for (const auto& path : changes.item_inserts) {
            if (path.section == s) {
                if (path.item >= new_items.size()) return std::nullopt;
                pins.emplace_back(path.item, new_items[path.item]);
            }
        }
        std::vector<int> survivors;
        for (std::size_t j = 0; j < old_items.size(); ++j) {
            if (!leaves[j]) {
                survivors.push_back(old_items[j]);
            }
        }
        auto items = place(survivors.size() + pins.size(), pins, survivors);
        if (!items) return std::nullopt;
        after.emplace_back(id, std::move(*items));
    }
    return after;
}

// Random old/new pair. Section and item keys are unique; items stay in their
// section, move to another one, or disappear, and fresh keys appear.
std::pair<TestSnapshot, TestSnapshot> random_pair(std::mt19937& rng) {
    std::uniform_int_distribution<int> percent(0, 99);
    auto below = [&](std::size_t n) { return std::uniform_int_distribution<std::size_t>(0, n - 1)(rng); };

    std::vector<SectionModel<std::string, int>> old_model;
    int next_item = 0;
    const std::size_t old_sections = below(6);
    for (std::size_t s = 0; s < old_sections; ++s) {
        SectionModel<std::string, int> section{"s" + std::to_string(s), {}};
        const std::size_t count = below(8);
        for (std::size_t k = 0; k < count; ++k) {
            section.items.push_back(next_item++);
        }
        old_model.push_back(std::move(section));
    }

    std::vector<SectionModel<std::string, int>> new_model;
    for (const auto& section : old_model) {
        if (percent(rng) >= 20) {
            new_model.push_back({section.id, {}});
        }
    }
    if (!new_model.empty()) {
        for (int k = percent(rng) % 3; k > 0; --k) {
            std::swap(new_model[below(new_model.size())], new_model[below(new_model.size())]);
        }
    }
    for (int k = percent(rng) % 3; k > 0; --k) {
        const auto at = below(new_model.size() + 1);
        new_model.insert(new_model.begin() + static_cast<std::ptrdiff_t>(at),
                         SectionModel<std::string, int>{"n" + std::to_string(k), {}});
    }
    if (new_model.empty()) {
        return {build(old_model), build(new_model)};
    }

    for (const auto& section : old_model) {
        auto home = std::find_if(new_model.begin(), new_model.end(),
                                 [&](const auto& candidate) { return candidate.id == section.id; });
        for (int item : section.items) {
            if (percent(rng) < 15) {
                continue;
            }
            if (home != new_model.end() && percent(rng) < 75) {
                home->items.push_back(item);
            } else {
                new_model[below(new_model.size())].items.push_back(item);
            }
        }
    }
    for (auto& section : new_model) {
        if (!section.items.empty()) {
            for (int k = percent(rng) % 3; k > 0; --k) {
                std::swap(section.items[below(section.items.size())], section.items[below(section.items.size())]);
            }
        }
        for (int k = percent(rng) % 3; k > 0; --k) {
            const auto at = below(section.items.size() + 1);
            section.items.insert(section.items.begin() + static_cast<std::ptrdiff_t>(at), next_item++);
        }
    }
    return {build(old_model), build(new_model)};
}

// Items carry an identity and a payload; only the identity takes part in
// hashing and equality.
struct Row {
    int id = 0;
    std::string text;

    bool operator==(const Row& other) const { return id == other.id; }
};

} // namespace

namespace std {
template <>
struct hash<Row> {
    std::size_t operator()(const Row& r) const noexcept { return std::hash<int>{}(r.id); }
};
} // namespace std

// ============================================================
// Structure
// ============================================================

TEST_CASE("sectioned_diff of identical snapshots is empty", "[sectioned_diff][basic]") {
    auto s = build({{"a", {1, 2, 3}}, {"b", {4}}});
    auto changes = sectioned_diff(s, s);
    REQUIRE(changes.empty());
    REQUIRE_FALSE(changes.has_structural_changes());
}

TEST_CASE("sectioned_diff section level changes", "[sectioned_diff][sections]") {
    auto old_s = build({{"a", {1}}, {"b", {2}}, {"c", {3}}});

    SECTION("Insert and delete") {
        auto new_s = build({{"a", {1}}, {"c", {3}}, {"d", {4}}});
        auto changes = sectioned_diff(old_s, new_s);
        REQUIRE(changes.section_deletes == std::vector<std::size_t>{1});
        REQUIRE(changes.section_inserts == std::vector<std::size_t>{2});
        REQUIRE(changes.section_moves.empty());
        // Items of removed or added sections travel with their section.
        REQUIRE(changes.item_deletes.empty());
        REQUIRE(changes.item_inserts.empty());
    }

    SECTION("Move is reduced to the minimum") {
        auto new_s = build({{"c", {3}}, {"a", {1}}, {"b", {2}}});
        auto changes = sectioned_diff(old_s, new_s);
        REQUIRE(changes.section_moves.size() == 1);
        REQUIRE(changes.section_moves[0] == Move{2, 0});
        REQUIRE(changes.item_moves.empty());
    }
}

TEST_CASE("sectioned_diff item level changes", "[sectioned_diff][items]") {
    auto old_s = build({{"a", {1, 2, 3}}, {"b", {4, 5}}});
    auto new_s = build({{"a", {3, 1, 6}}, {"b", {5}}});

    auto changes = sectioned_diff(old_s, new_s);
    REQUIRE(changes.section_deletes.empty());
    REQUIRE(changes.section_inserts.empty());

    // Deletes descend, inserts ascend.
    REQUIRE(changes.item_deletes == std::vector<IndexPath>{{1, 0}, {0, 1}});
    REQUIRE(changes.item_inserts == std::vector<IndexPath>{{0, 2}});
    REQUIRE(changes.item_moves.size() == 1);
    REQUIRE(changes.item_moves[0] == ItemMove{{0, 2}, {0, 0}});
}

TEST_CASE("sectioned_diff turns cross-section transfers into moves", "[sectioned_diff][cross]") {
    auto old_s = build({{"todo", {1, 2, 3}}, {"done", {4}}});
    auto new_s = build({{"todo", {1, 3}}, {"done", {2, 4}}});

    auto changes = sectioned_diff(old_s, new_s);
    REQUIRE(changes.item_deletes.empty());
    REQUIRE(changes.item_inserts.empty());
    REQUIRE(changes.item_moves == std::vector<ItemMove>{ItemMove{{0, 1}, {1, 0}}});
    REQUIRE(changes.has_structural_changes());
}

TEST_CASE("sectioned_diff items leaving a deleted section are inserts", "[sectioned_diff][cross]") {
    auto old_s = build({{"a", {1}}, {"b", {2}}});
    auto new_s = build({{"a", {1, 2}}});

    auto changes = sectioned_diff(old_s, new_s);
    REQUIRE(changes.section_deletes == std::vector<std::size_t>{1});
    REQUIRE(changes.item_inserts == std::vector<IndexPath>{{0, 1}});
    REQUIRE(changes.item_moves.empty());
}

// ============================================================
// Apply order
// ============================================================

TEST_CASE("sectioned_diff replays into the new snapshot", "[sectioned_diff][replay]") {
    SECTION("Section move with item and cross-section moves") {
        auto old_s = build({{"a", {1, 2, 3}}, {"b", {4, 5}}, {"c", {6}}});
        auto new_s = build({{"c", {6, 2}}, {"a", {3, 1}}, {"b", {5, 4, 7}}});

        auto changes = sectioned_diff(old_s, new_s);
        REQUIRE_FALSE(changes.section_moves.empty());
        REQUIRE_FALSE(changes.item_moves.empty());

        auto replayed = replay(old_s, new_s, changes);
        REQUIRE(replayed.has_value());
        REQUIRE(*replayed == layout(new_s));
    }

    SECTION("Sections deleted and inserted around moved items") {
        auto old_s = build({{"a", {1, 2}}, {"b", {3, 4}}, {"c", {5}}});
        auto new_s = build({{"d", {9}}, {"c", {4, 5}}, {"a", {2, 3, 1}}});

        auto changes = sectioned_diff(old_s, new_s);
        auto replayed = replay(old_s, new_s, changes);
        REQUIRE(replayed.has_value());
        REQUIRE(*replayed == layout(new_s));
    }

    SECTION("Randomized snapshots") {
        std::mt19937 rng(7321);
        for (int round = 0; round < 500; ++round) {
            const auto [old_s, new_s] = random_pair(rng);
            const auto changes = sectioned_diff(old_s, new_s);
            const auto replayed = replay(old_s, new_s, changes);
            INFO("round " << round << "\n" << changes.to_string());
            REQUIRE(replayed.has_value());
            REQUIRE(*replayed == layout(new_s));
        }
    }
}

// ============================================================
// Markers
// ============================================================

TEST_CASE("sectioned_diff folds reload and reconfigure markers", "[sectioned_diff][markers]") {
    auto old_s = build({{"a", {1, 2}}, {"b", {3}}});
    auto new_s = old_s;
    new_s.reload_items({2});
    new_s.reconfigure_items({3});
    new_s.reload_sections({"b"});

    auto changes = sectioned_diff(old_s, new_s);
    REQUIRE_FALSE(changes.has_structural_changes());
    REQUIRE_FALSE(changes.empty());
    REQUIRE(changes.item_reloads == std::vector<IndexPath>{{0, 1}});
    REQUIRE(changes.item_reconfigures == std::vector<IndexPath>{{1, 0}});
    REQUIRE(changes.section_reloads == std::vector<std::size_t>{1});
}

TEST_CASE("sectioned_diff skips markers on inserted items", "[sectioned_diff][markers]") {
    auto old_s = build({{"a", {1}}});
    auto new_s = build({{"a", {1, 2}}});
    new_s.reload_items({2});

    auto changes = sectioned_diff(old_s, new_s);
    REQUIRE(changes.item_inserts == std::vector<IndexPath>{{0, 1}});
    REQUIRE(changes.item_reloads.empty());
}

TEST_CASE("StagedChangeset renders a readable dump", "[sectioned_diff][print]") {
    auto old_s = build({{"a", {1, 2}}});
    auto new_s = build({{"a", {2, 3}}});

    auto text = sectioned_diff(old_s, new_s).to_string();
    REQUIRE(text.find("item deletes: [0, 0]") != std::string::npos);
    REQUIRE(text.find("item inserts: [0, 1]") != std::string::npos);

    REQUIRE(StagedChangeset{}.to_string() == "StagedChangeset (empty)\n");
    REQUIRE(to_string(IndexPath{3, 4}) == "[3, 4]");
}

// ============================================================
// Hierarchical sections and content changes
// ============================================================

TEST_CASE("flatten_into replaces a section with visible tree items", "[sectioned_diff][hierarchical]") {
    auto base = build({{"head", {100}}, {"tree", {}}});

    HierarchicalSnapshot<int> tree;
    tree.append({1, 4});
    tree.append({2, 3}, 1);

    auto flat = flatten_into(base, std::string("tree"), tree);
    REQUIRE(flat.has_value());
    REQUIRE(to_vector(flat->item_identifiers("tree")) == std::vector<int>{1, 4});

    tree.expand({1});
    auto expanded = flatten_into(*flat, std::string("tree"), tree);
    REQUIRE(to_vector(expanded->item_identifiers("tree")) == std::vector<int>{1, 2, 3, 4});

    auto changes = sectioned_diff(*flat, *expanded);
    REQUIRE(changes.item_inserts == std::vector<IndexPath>{{1, 1}, {1, 2}});
    REQUIRE(changes.item_deletes.empty());

    REQUIRE_FALSE(flatten_into(base, std::string("missing"), tree).has_value());
}

TEST_CASE("items_to_reconfigure detects content changes", "[sectioned_diff][content]") {
    Snapshot<int, Row> old_s;
    old_s.append_sections({0});
    old_s.append_items({Row{1, "one"}, Row{2, "two"}, Row{3, "three"}});

    Snapshot<int, Row> new_s;
    new_s.append_sections({0});
    new_s.append_items({Row{2, "TWO"}, Row{3, "three"}, Row{4, "four"}});

    auto changed = items_to_reconfigure(old_s, new_s,
                                        [](const Row& a, const Row& b) { return a.text == b.text; });
    REQUIRE(changed.size() == 1);
    REQUIRE(changed[0].id == 2);
    REQUIRE(changed[0].text == "TWO");

    new_s.reconfigure_items(changed);
    auto changes = sectioned_diff(old_s, new_s);
    REQUIRE(changes.item_reconfigures == std::vector<IndexPath>{{0, 0}});
}

// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file update_scheduler.h
/// @brief Per-consumer entry point: snapshot transitions in, changesets out.
///
/// UpdateScheduler owns the committed snapshot of one rendering consumer.
/// Each apply call queues a transition on a TransitionPipeline; when the
/// transition commits, the committed state (a lager store on the apply
/// context) is replaced and the render callback receives the changeset to
/// play back on the rendering surface.
///
/// Every member except the constructor's executor handoff must be used from
/// the apply context.
///
/// Usage:
/// @code
///   SerialExecutor ui;
///   UpdateScheduler<int, std::string> scheduler(ui.as_executor(), [&](const auto& update) {
///       table.perform(update.changeset, update.animate);
///   });
///
///   Snapshot<int, std::string> next;
///   next.append_sections({0});
///   next.append_items({"a", "b"});
///   scheduler.apply(next, true, [](TransitionStatus s) { ... });
///   ui.poll();
/// @endcode

#pragma once

#include <listkit/listkit_config.h>
#include <listkit/errors.h>
#include <listkit/executor.h>
#include <listkit/hierarchical_snapshot.h>
#include <listkit/sectioned_diff.h>
#include <listkit/snapshot.h>
#include <listkit/staged_changeset.h>
#include <listkit/transition_pipeline.h>

#include <immer/map.hpp>
#include <lager/event_loop/manual.hpp>
#include <lager/store.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace listkit {

// ============================================================
// Committed state (lager model)
// ============================================================

template <typename SectionID, typename ItemID>
struct TransitionModel {
    Snapshot<SectionID, ItemID> snapshot;
    /// Trees installed through apply_section, by section.
    immer::map<SectionID, HierarchicalSnapshot<ItemID>> section_trees;
    Generation generation = 0;

    // Each commit carries a fresh generation.
    bool operator==(const TransitionModel& other) const { return generation == other.generation; }
};

namespace actions {

template <typename SectionID, typename ItemID>
struct Commit {
    Snapshot<SectionID, ItemID> snapshot;
    Generation generation = 0;
    std::optional<std::pair<SectionID, HierarchicalSnapshot<ItemID>>> section_tree;
};

} // namespace actions

template <typename SectionID, typename ItemID>
using TransitionAction = std::variant<actions::Commit<SectionID, ItemID>>;

template <typename SectionID, typename ItemID>
TransitionModel<SectionID, ItemID> reduce_transition(TransitionModel<SectionID, ItemID> model,
                                                     TransitionAction<SectionID, ItemID> action) {
    return std::visit(
        [&](auto&& act) -> TransitionModel<SectionID, ItemID> {
            using T = std::decay_t<decltype(act)>;
            if constexpr (std::is_same_v<T, actions::Commit<SectionID, ItemID>>) {
                auto trees = model.section_trees;
                for (const auto& [section, tree] : model.section_trees) {
                    if (!act.snapshot.contains_section(section)) {
                        trees = trees.erase(section);
                    } else if (!act.section_tree &&
                               to_vector(act.snapshot.item_identifiers(section)) != tree.visible_items()) {
                        trees = trees.erase(section);
                    }
                }
                if (act.section_tree) {
                    trees = trees.set(act.section_tree->first, act.section_tree->second);
                }
                return TransitionModel<SectionID, ItemID>{act.snapshot, trees, act.generation};
            }
            return model;
        },
        std::move(action));
}

namespace detail {

template <typename SectionID, typename ItemID>
auto make_transition_store(TransitionModel<SectionID, ItemID> initial) {
    return lager::make_store<TransitionAction<SectionID, ItemID>>(
        std::move(initial), lager::with_manual_event_loop{},
        lager::with_reducer(&reduce_transition<SectionID, ItemID>));
}

template <typename SectionID, typename ItemID>
using TransitionStore =
    decltype(make_transition_store<SectionID, ItemID>(std::declval<TransitionModel<SectionID, ItemID>>()));

} // namespace detail

// ============================================================
// Scheduler
// ============================================================

template <typename SectionID, typename ItemID>
struct Update {
    StagedChangeset changeset;
    bool animate = true;
    /// Discard everything and re-read the whole snapshot; changeset is empty.
    bool reload_data = false;
    /// State the changeset leads to (already committed).
    Snapshot<SectionID, ItemID> snapshot;
};

template <typename ItemID>
struct SchedulerOptions : PipelineOptions {
    /// When set, items equal by identity but not by content are marked for
    /// reconfiguration before diffing.
    std::function<bool(const ItemID&, const ItemID&)> content_equal;
};

template <Identifier SectionID, Identifier ItemID>
class UpdateScheduler {
public:
    using SnapshotType = Snapshot<SectionID, ItemID>;
    using TreeType = HierarchicalSnapshot<ItemID>;
    using UpdateType = Update<SectionID, ItemID>;
    using RenderCallback = std::function<void(const UpdateType&)>;
    using Options = SchedulerOptions<ItemID>;

    UpdateScheduler(Executor apply_context, RenderCallback render, Options options = {})
        : state_(std::make_shared<State>(std::move(render), options.content_equal))
        , pipeline_(std::move(apply_context), static_cast<const PipelineOptions&>(options))
    {
    }

    UpdateScheduler(const UpdateScheduler&) = delete;
    UpdateScheduler& operator=(const UpdateScheduler&) = delete;

    /// Transition to `target`, diffing against whatever is committed when the
    /// transition starts.
    Generation apply(SnapshotType target, bool animate = true, Completion completion = {}) {
        auto job = std::make_unique<DiffJob>(state_, animate, [target = std::move(target)](const SnapshotType&) {
            return target;
        });
        return pipeline_.submit(std::move(job), std::move(completion));
    }

    /// Replace the items of `section` with the visible items of `tree`. The
    /// target is built from the state committed when the transition starts.
    /// Fails when `section` does not exist at that point.
    Generation apply_section(const SectionID& section, TreeType tree, bool animate = true,
                             Completion completion = {}) {
        auto job = std::make_unique<DiffJob>(state_, animate, [section, tree](const SnapshotType& current) {
            auto target = flatten_into(current, section, tree);
            if (!target) {
                throw precondition_error("UpdateScheduler::apply_section: section does not exist");
            }
            return *target;
        });
        job->section_tree.emplace(section, std::move(tree));
        return pipeline_.submit(std::move(job), std::move(completion));
    }

    /// Commit `target` without diffing; the renderer is told to reload.
    Generation apply_using_reload_data(SnapshotType target, Completion completion = {}) {
        return pipeline_.submit(std::make_unique<ReloadJob>(state_, std::move(target)), std::move(completion));
    }

    std::size_t cancel_pending() { return pipeline_.cancel_pending(); }
    [[nodiscard]] bool idle() const { return pipeline_.idle(); }

    // ========================================================================
    // Committed state
    // ========================================================================

    [[nodiscard]] SnapshotType snapshot() const { return model().snapshot; }

    /// Tree installed by apply_section for `section`, or the section's items
    /// as a flat list of roots. nullopt when the section does not exist.
    [[nodiscard]] std::optional<TreeType> section_snapshot(const SectionID& section) const {
        const auto& m = model();
        if (!m.snapshot.contains_section(section)) {
            return std::nullopt;
        }
        if (const auto* tree = m.section_trees.find(section)) {
            return *tree;
        }
        TreeType flat;
        flat.append(to_vector(m.snapshot.item_identifiers(section)));
        return flat;
    }

    [[nodiscard]] std::optional<ItemID> item_identifier(const IndexPath& path) const {
        return model().snapshot.item_identifier(path);
    }

    [[nodiscard]] std::optional<IndexPath> index_path(const ItemID& item) const {
        return model().snapshot.index_path(item);
    }

    [[nodiscard]] std::optional<SectionID> section_identifier(std::size_t section_index) const {
        return model().snapshot.section_identifier_at(section_index);
    }

    [[nodiscard]] std::optional<std::size_t> index_of_section(const SectionID& section) const {
        return model().snapshot.index_of_section(section);
    }

    [[nodiscard]] std::size_t number_of_sections() const { return model().snapshot.number_of_sections(); }

    [[nodiscard]] std::size_t number_of_items(std::size_t section_index) const {
        return model().snapshot.number_of_items_in_section_at(section_index);
    }

    [[nodiscard]] Generation applied_generation() const { return model().generation; }
    [[nodiscard]] Generation latest_generation() const { return pipeline_.latest_generation(); }

private:
    using Model = TransitionModel<SectionID, ItemID>;
    using Store = detail::TransitionStore<SectionID, ItemID>;

    struct State {
        Store store;
        RenderCallback render;
        std::function<bool(const ItemID&, const ItemID&)> content_equal;

        State(RenderCallback render_cb, std::function<bool(const ItemID&, const ItemID&)> equal)
            : store(detail::make_transition_store<SectionID, ItemID>(Model{}))
            , render(std::move(render_cb))
            , content_equal(std::move(equal))
        {
        }

        void publish(actions::Commit<SectionID, ItemID> action, UpdateType update) {
            store.dispatch(std::move(action));
            if (render) {
                render(update);
            }
        }
    };

    class DiffJob : public TransitionJob {
    public:
        using Target = std::function<SnapshotType(const SnapshotType&)>;

        DiffJob(std::shared_ptr<State> state, bool animate, Target target)
            : state_(std::move(state))
            , animate_(animate)
            , make_target_(std::move(target))
        {
        }

        std::size_t prepare() override {
            old_ = state_->store.get().snapshot;
            target_ = make_target_(old_);
            return old_.number_of_items() + target_.number_of_items();
        }

        void compute() override {
            if (state_->content_equal) {
                target_.reconfigure_items(items_to_reconfigure(old_, target_, state_->content_equal));
            }
            changeset_ = sectioned_diff(old_, target_);
        }

        void commit(Generation generation) override {
            auto committed = target_.clearing_markers();
            UpdateType update{std::move(changeset_), animate_, false, committed};
            state_->publish({std::move(committed), generation, std::move(section_tree)}, std::move(update));
        }

        std::optional<std::pair<SectionID, TreeType>> section_tree;

    private:
        std::shared_ptr<State> state_;
        bool animate_;
        Target make_target_;
        SnapshotType old_;
        SnapshotType target_;
        StagedChangeset changeset_;
    };

    class ReloadJob : public TransitionJob {
    public:
        ReloadJob(std::shared_ptr<State> state, SnapshotType target)
            : state_(std::move(state))
            , target_(std::move(target))
        {
        }

        std::size_t prepare() override { return 0; }
        void compute() override {}

        void commit(Generation generation) override {
            auto committed = target_.clearing_markers();
            UpdateType update{StagedChangeset{}, false, true, committed};
            state_->publish({std::move(committed), generation, std::nullopt}, std::move(update));
        }

    private:
        std::shared_ptr<State> state_;
        SnapshotType target_;
    };

    const Model& model() const { return state_->store.get(); }

    std::shared_ptr<State> state_;
    TransitionPipeline pipeline_; // declared last: joins workers before state_ goes
};

} // namespace listkit

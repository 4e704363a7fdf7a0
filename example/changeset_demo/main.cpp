// main.cpp
// Changeset Demo - Driving a list view through listkit
//
// A pretend "table view" owns a rendering thread (drained from main through a
// SerialExecutor). The demo pushes a series of snapshots through an
// UpdateScheduler and prints the changeset each transition produces:
//
// Step 1: Initial load (section inserts)
// Step 2: Move a task between sections (cross-section move)
// Step 3: Reorder (minimal moves)
// Step 4: Outline section built from a HierarchicalSnapshot, then expanded
// Step 5: Full reload without diffing

#include <listkit/update_scheduler.h>

#include <iostream>
#include <string>

using namespace listkit;

using Tasks = Snapshot<std::string, std::string>;
using TaskScheduler = UpdateScheduler<std::string, std::string>;

// ============================================================
// Pretend Rendering Surface
// ============================================================

void render(const Update<std::string, std::string>& update)
{
    if (update.reload_data) {
        std::cout << "  -> reloadData()\n";
    } else {
        std::cout << "  -> performBatchUpdates(animated: " << (update.animate ? "yes" : "no") << ")\n";
        update.changeset.print();
    }
    for (const auto& section : update.snapshot.section_identifiers()) {
        std::cout << "     " << section << ":";
        for (const auto& item : update.snapshot.item_identifiers(section)) {
            std::cout << " " << item;
        }
        std::cout << "\n";
    }
}

void report(TransitionStatus status)
{
    std::cout << "  (" << to_string(status) << ")\n\n";
}

// ============================================================
// Main Application
// ============================================================

int main()
{
    SerialExecutor ui;
    TaskScheduler scheduler(ui.as_executor(), render);

    std::cout << "=== Changeset Demo ===\n\n";

    std::cout << "--- Step 1: Initial load ---\n";
    auto tasks = make_snapshot<std::string, std::string>({
        {"todo", {"write", "review", "ship"}},
        {"done", {"plan"}},
    });
    scheduler.apply(tasks, false, report);
    ui.poll();

    std::cout << "--- Step 2: Finish 'write' ---\n";
    tasks.move_item_before("write", "plan");
    tasks.reconfigure_items({"plan"});
    scheduler.apply(tasks, true, report);
    ui.poll();
    tasks = tasks.clearing_markers();

    std::cout << "--- Step 3: Reorder todo ---\n";
    tasks.move_item_before("ship", "review");
    scheduler.apply(tasks, true, report);
    ui.poll();

    std::cout << "--- Step 4: Outline section ---\n";
    tasks.append_sections({"outline"});
    scheduler.apply(tasks, true, report);
    ui.poll();

    HierarchicalSnapshot<std::string> outline;
    outline.append({"intro", "body"});
    outline.append({"motivation", "scope"}, "intro");
    scheduler.apply_section("outline", outline, true, report);
    ui.poll();

    outline.expand({"intro"});
    scheduler.apply_section("outline", outline, true, report);
    ui.poll();

    std::cout << "--- Step 5: Reload ---\n";
    scheduler.apply_using_reload_data(scheduler.snapshot(), report);
    ui.poll();

    std::cout << "Applied generation: " << scheduler.applied_generation() << "\n";
    return 0;
}

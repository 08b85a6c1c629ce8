#include <slotplan/algo/slot_allocator.hpp>

#include <slotplan/algo/allocation_context.hpp>
#include <slotplan/algo/backtracking_search.hpp>
#include <slotplan/algo/dependency_graph.hpp>
#include <slotplan/algo/fixed_inserter.hpp>
#include <slotplan/algo/greedy_placer.hpp>
#include <slotplan/algo/lateness_refiner.hpp>
#include <slotplan/algo/priority_propagator.hpp>
#include <slotplan/algo/task_queue.hpp>

#include <algorithm>
#include <cstdint>
#include <string_view>

namespace slotplan::algo {

namespace {

void trace_phase(const AllocationContext& context, std::string_view name) {
    context.trace([&](core::TraceWriter& w) {
        w.type("phase");
        w.field("name", name);
        w.field("free_slots", static_cast<std::int64_t>(context.grid().free_count()));
    });
}

std::vector<core::TaskIndex> pending_tasks(const AllocationContext& context,
                                           const std::vector<bool>& excluded) {
    std::vector<core::TaskIndex> pending;
    for (core::TaskIndex i = 0; i < context.tasks().size(); ++i) {
        if (!excluded[i] && !context.is_completed(i)) {
            pending.push_back(i);
        }
    }
    return pending;
}

void run_greedy_phase(AllocationContext& context, GreedyPlacer& greedy,
                      const std::vector<bool>& excluded) {
    auto candidates = pending_tasks(context, excluded);
    TaskQueue queue(context.tasks(), context.graph(), candidates);

    // Every task in the queue got one chance since the last placement
    std::size_t stalled = 0;
    while (!queue.empty() && stalled < queue.size()) {
        core::TaskIndex task = queue.pop();
        if (context.is_completed(task)) {
            continue;
        }

        switch (greedy.place(task)) {
            case PlacementOutcome::Placed:
                stalled = 0;
                break;
            case PlacementOutcome::NotReady:
                context.trace([&](core::TraceWriter& w) {
                    w.type("task_deferred");
                    w.field("task", std::string_view(context.task(task).id));
                    w.field("phase", std::string_view("greedy"));
                });
                queue.defer(task);
                ++stalled;
                break;
            case PlacementOutcome::Failed:
                break;
        }

        for (core::TaskIndex displaced : greedy.take_displaced()) {
            queue.defer(displaced);
        }
    }
}

// Unplace tasks that ended up before one of their dependencies, until no
// such task is left.
void sweep(AllocationContext& context) {
    bool changed = true;
    while (changed) {
        changed = false;
        std::vector<core::TaskIndex> placed(context.placed().begin(), context.placed().end());
        for (core::TaskIndex task : placed) {
            const auto& t = context.task(task);
            auto deps = context.graph().dependencies(task);
            bool violated = std::any_of(deps.begin(), deps.end(), [&](core::TaskIndex dep) {
                const auto& d = context.task(dep);
                return !d.assigned || d.assigned->end > t.assigned->start;
            });
            if (violated) {
                context.unassign(task);
                context.record_failure(task, core::FailureReason::DependencyUnplaced);
                changed = true;
                break;
            }
        }
    }
}

} // anonymous namespace

SlotAllocator::SlotAllocator(core::GridConfig config, AllocatorOptions options)
    : config_(config)
    , options_(options) {
    config_.validate();
}

AllocationReport SlotAllocator::allocate(std::vector<core::Task>& tasks, core::TraceWriter* writer) const {
    for (auto& task : tasks) {
        task.assigned.reset();
        task.rescheduled = false;
    }

    DependencyGraph graph(tasks);
    check_acyclic(tasks, graph);
    propagate_priorities(tasks, graph, writer);

    AllocationContext context(tasks, graph, config_, writer);
    std::vector<bool> excluded(tasks.size(), false);

    for (core::TaskIndex i = 0; i < tasks.size(); ++i) {
        if (!tasks[i].effort()) {
            context.record_failure(i, core::FailureReason::MissingEffort);
            excluded[i] = true;
        } else if (!graph.unknown_dependencies(i).empty()) {
            context.record_failure(i, core::FailureReason::UnknownDependency);
            excluded[i] = true;
        }
    }

    GreedyPlacer greedy(context);

    trace_phase(context, "fixed_insertion");
    FixedInserter inserter(context, greedy);
    for (core::TaskIndex task : TaskQueue(tasks, graph, pending_tasks(context, excluded)).order()) {
        if (!tasks[task].is_fixed()) {
            continue;
        }
        if (inserter.insert(task) == FixedOutcome::Unschedulable) {
            excluded[task] = true;
        }
    }
    // Displaced tasks are unplaced, so pending_tasks() hands them to the
    // greedy phase below
    greedy.drop_displaced();

    if (options_.refine_lateness) {
        LatenessRefiner(context, greedy).refine();
        greedy.drop_displaced();
    }

    trace_phase(context, "greedy");
    run_greedy_phase(context, greedy, excluded);

    AllocationReport report;
    if (options_.backtracking) {
        auto leftovers = pending_tasks(context, excluded);
        if (!leftovers.empty()) {
            trace_phase(context, "backtracking");
            auto result = BacktrackingSearch(context, options_.search_node_limit).run(leftovers);
            report.search_nodes = result.nodes;
            report.search_bounded = result.bounded;
        }
    }

    sweep(context);

    report.placed.assign(context.placed().begin(), context.placed().end());
    report.evictions = context.eviction_count();
    for (core::TaskIndex i = 0; i < tasks.size(); ++i) {
        if (tasks[i].rescheduled) {
            ++report.rescheduled;
        }
        if (context.is_completed(i)) {
            continue;
        }
        core::FailureReason reason = context.failure(i).value_or(core::FailureReason::NoFreeWindow);
        if (context.was_evicted(i) && reason != core::FailureReason::DependencyUnplaced) {
            reason = core::FailureReason::EvictionDeadlock;
        }
        report.unplaced.push_back(UnplacedTask{i, reason});

        context.trace([&](core::TraceWriter& w) {
            w.type("task_unplaced");
            w.field("task", std::string_view(tasks[i].id));
            w.field("reason", core::to_string(reason));
        });
    }
    return report;
}

} // namespace slotplan::algo

#include <slotplan/algo/greedy_placer.hpp>

#include <slotplan/algo/task_queue.hpp>

#include <algorithm>
#include <string_view>
#include <utility>

namespace slotplan::algo {

GreedyPlacer::GreedyPlacer(AllocationContext& context)
    : context_(context) {}

bool GreedyPlacer::can_evict(core::TaskIndex task, core::TaskIndex victim) const {
    const auto& t = context_.task(task);
    const auto& v = context_.task(victim);
    return victim != task
        && v.priority < t.priority
        && !v.at_fixed_window()
        && !context_.graph().depends_on(task, victim);
}

PlacementOutcome GreedyPlacer::place(core::TaskIndex task) {
    if (context_.is_completed(task)) {
        return PlacementOutcome::Placed;
    }
    if (!context_.dependencies_completed(task)) {
        context_.record_failure(task, core::FailureReason::DependencyUnplaced);
        return PlacementOutcome::NotReady;
    }

    auto range = context_.feasible_window(task);
    if (const auto* reason = std::get_if<core::FailureReason>(&range)) {
        context_.record_failure(task, *reason);
        return PlacementOutcome::Failed;
    }
    const auto& window = std::get<FeasibleWindow>(range);

    for (core::SlotIndex start = window.first; start <= window.last; ++start) {
        auto check = context_.check_window(task, start);
        if (check.blocked) {
            continue;
        }
        if (check.conflicts.empty()) {
            context_.commit(task, start);
            return PlacementOutcome::Placed;
        }

        bool evictable = std::all_of(check.conflicts.begin(), check.conflicts.end(),
            [this, task](core::TaskIndex victim) { return can_evict(task, victim); });
        if (!evictable) {
            continue;
        }

        auto evicted = context_.evict(check.conflicts);
        if (context_.check_window(task, start).free()) {
            context_.commit(task, start);
            replace(std::move(evicted));
            return PlacementOutcome::Placed;
        }
        // Eviction did not clear the window; give the tasks back their chance
        replace(std::move(evicted));
    }

    context_.record_failure(task, core::FailureReason::NoFreeWindow);
    return PlacementOutcome::Failed;
}

void GreedyPlacer::replace(std::vector<core::TaskIndex> evicted) {
    for (core::TaskIndex task : evicted) {
        context_.mark_rescheduled(task);
    }
    TaskQueue::sort(context_.tasks(), context_.graph(), evicted);

    // Dependencies of an evicted task may be evicted with it; sweep until a
    // pass places nothing.
    bool progress = true;
    while (progress && !evicted.empty()) {
        progress = false;
        std::vector<core::TaskIndex> waiting;
        for (core::TaskIndex task : evicted) {
            switch (place(task)) {
                case PlacementOutcome::Placed:
                    progress = true;
                    break;
                case PlacementOutcome::NotReady:
                    waiting.push_back(task);
                    break;
                case PlacementOutcome::Failed:
                    displaced_.push_back(task);
                    break;
            }
        }
        evicted = std::move(waiting);
    }

    for (core::TaskIndex task : evicted) {
        context_.trace([&](core::TraceWriter& w) {
            w.type("task_displaced");
            w.field("task", std::string_view(context_.task(task).id));
        });
        displaced_.push_back(task);
    }
}

std::vector<core::TaskIndex> GreedyPlacer::take_displaced() {
    std::vector<core::TaskIndex> out;
    out.swap(displaced_);
    return out;
}

} // namespace slotplan::algo

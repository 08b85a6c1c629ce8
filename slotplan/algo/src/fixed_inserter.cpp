#include <slotplan/algo/fixed_inserter.hpp>

#include <slotplan/core/error.hpp>

#include <algorithm>
#include <string_view>
#include <utility>

namespace slotplan::algo {

FixedInserter::FixedInserter(AllocationContext& context, GreedyPlacer& greedy)
    : context_(context)
    , greedy_(greedy) {}

bool FixedInserter::can_evict(core::TaskIndex task, core::TaskIndex victim) const {
    if (victim == task) {
        return false;
    }
    const auto& v = context_.task(victim);
    return !(v.at_fixed_window() && v.priority >= context_.task(task).priority);
}

bool FixedInserter::touches_grid(const core::Interval& window) const {
    auto first = context_.grid().first_index_at_or_after(window.start);
    return first && context_.grid().slot(*first).start < window.end;
}

FixedOutcome FixedInserter::displace(core::TaskIndex task) {
    context_.trace([&](core::TraceWriter& w) {
        w.type("task_deferred");
        w.field("task", std::string_view(context_.task(task).id));
        w.field("phase", std::string_view("fixed"));
    });
    context_.mark_rescheduled(task);
    return FixedOutcome::Displaced;
}

FixedOutcome FixedInserter::insert(core::TaskIndex task) {
    const auto& t = context_.task(task);
    if (!t.fixed) {
        throw core::SchedulingError("task '" + t.id + "' has no fixed window");
    }
    if (context_.is_completed(task)) {
        return FixedOutcome::Placed;
    }
    if (!t.effort()) {
        context_.record_failure(task, core::FailureReason::MissingEffort);
        return FixedOutcome::Unschedulable;
    }

    const core::Interval window = *t.fixed;
    if (!touches_grid(window)) {
        context_.record_failure(task, core::FailureReason::OutsideWorkingHours);
        return FixedOutcome::Unschedulable;
    }

    auto start = context_.grid().index_of(window.start);
    if (!start) {
        return displace(task);
    }

    auto check = context_.check_window(task, *start);
    if (check.blocked) {
        return displace(task);
    }

    if (!check.conflicts.empty()) {
        bool evictable = std::all_of(check.conflicts.begin(), check.conflicts.end(),
            [this, task](core::TaskIndex victim) { return can_evict(task, victim); });
        if (!evictable) {
            return displace(task);
        }
        auto evicted = context_.evict(check.conflicts);
        context_.commit(task, *start);
        greedy_.replace(std::move(evicted));
        return FixedOutcome::Placed;
    }

    context_.commit(task, *start);
    return FixedOutcome::Placed;
}

} // namespace slotplan::algo

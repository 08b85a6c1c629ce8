#include <slotplan/algo/allocation_context.hpp>

#include <slotplan/algo/task_queue.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

namespace slotplan::algo {

AllocationContext::AllocationContext(std::vector<core::Task>& tasks,
                                     const DependencyGraph& graph,
                                     const core::GridConfig& config,
                                     core::TraceWriter* writer)
    : tasks_(tasks)
    , graph_(graph)
    , grid_(config)
    , writer_(writer)
    , completed_(tasks.size(), false)
    , start_slot_(tasks.size())
    , evicted_(tasks.size(), false)
    , failure_(tasks.size()) {}

bool AllocationContext::dependencies_completed(core::TaskIndex task) const {
    auto deps = graph_.dependencies(task);
    return std::all_of(deps.begin(), deps.end(),
        [this](core::TaskIndex dep) { return completed_[dep]; });
}

core::Minutes AllocationContext::effort(core::TaskIndex task) const {
    return tasks_.at(task).effort().value_or(0);
}

namespace {

// Latest start that lets a task of the given length plus its rest end by limit.
// Computed wide and clamped to [-1, MINUTES_PER_WEEK]; -1 has no slot at or
// before it.
core::Minute start_by(core::Minute limit, core::Minutes length, core::Minutes rest) {
    std::int64_t start = std::int64_t{limit} - length - rest;
    return static_cast<core::Minute>(std::clamp<std::int64_t>(start, -1, core::MINUTES_PER_WEEK));
}

} // anonymous namespace

core::SlotIndex AllocationContext::rest_end(core::SlotIndex start, core::Minutes length) const {
    auto task_end = start + static_cast<core::SlotIndex>(length);
    auto rest = static_cast<core::SlotIndex>(grid_.config().break_duration);
    // The rest is cut where the working block ends
    return std::min(task_end + rest, grid_.block_end(start));
}

std::variant<FeasibleWindow, core::FailureReason>
AllocationContext::feasible_window(core::TaskIndex task) const {
    const auto& t = tasks_.at(task);
    core::Minutes length = effort(task);
    if (length <= 0) {
        return core::FailureReason::MissingEffort;
    }
    if (grid_.size() < static_cast<std::size_t>(length)) {
        return core::FailureReason::NoFreeWindow;
    }

    core::Minute floor = t.earliest_start.value_or(0);
    for (core::TaskIndex dep : graph_.dependencies(task)) {
        if (!completed_[dep]) {
            return core::FailureReason::DependencyUnplaced;
        }
        floor = std::max(floor, tasks_[dep].assigned->end);
    }

    const core::Minutes rest = grid_.config().break_duration;
    constexpr core::Minute unbounded = std::numeric_limits<core::Minute>::max();

    core::Minute deadline_start = unbounded;
    if (t.deadline) {
        deadline_start = start_by(*t.deadline, length, rest);
    }
    core::Minute dependent_start = unbounded;
    for (core::TaskIndex dependent : graph_.dependents(task)) {
        if (completed_[dependent]) {
            dependent_start = std::min(dependent_start,
                                       start_by(tasks_[dependent].assigned->start, length, rest));
        }
    }

    auto first = grid_.first_index_at_or_after(floor);
    if (!first) {
        return core::FailureReason::NoFreeWindow;
    }

    core::SlotIndex last = grid_.size() - static_cast<std::size_t>(length);
    if (deadline_start != unbounded) {
        auto bound = grid_.last_index_at_or_before(deadline_start);
        if (!bound || *bound < *first) {
            return core::FailureReason::DeadlineUnreachable;
        }
        last = std::min(last, *bound);
    }
    if (dependent_start != unbounded) {
        auto bound = grid_.last_index_at_or_before(dependent_start);
        if (!bound) {
            return core::FailureReason::NoFreeWindow;
        }
        last = std::min(last, *bound);
    }
    if (t.latest_start) {
        auto bound = grid_.last_index_at_or_before(*t.latest_start);
        if (!bound) {
            return core::FailureReason::NoFreeWindow;
        }
        last = std::min(last, *bound);
    }
    if (last < *first) {
        return core::FailureReason::NoFreeWindow;
    }
    return FeasibleWindow{*first, last};
}

WindowCheck AllocationContext::check_window(core::TaskIndex task, core::SlotIndex start) const {
    WindowCheck check;
    core::Minutes length = effort(task);
    auto count = static_cast<std::size_t>(length);

    if (length <= 0 || !grid_.is_contiguous(start, count)) {
        check.blocked = true;
        return check;
    }

    auto add_conflict = [&check, task](core::TaskIndex occupant) {
        if (occupant != task &&
            std::find(check.conflicts.begin(), check.conflicts.end(), occupant) == check.conflicts.end()) {
            check.conflicts.push_back(occupant);
        }
    };

    for (core::SlotIndex i = start; i < start + count; ++i) {
        const auto& slot = grid_.slot(i);
        if (slot.state == core::SlotState::Break) {
            check.blocked = true;
            return check;
        }
        if (slot.state == core::SlotState::Task) {
            add_conflict(*slot.occupant);
        }
    }

    for (core::SlotIndex i = start + count; i < rest_end(start, length); ++i) {
        const auto& slot = grid_.slot(i);
        if (slot.state == core::SlotState::Break) {
            if (slot.periodic_break || slot.rest_owner == task) {
                continue;
            }
            check.blocked = true;
            return check;
        }
        if (slot.state == core::SlotState::Task) {
            add_conflict(*slot.occupant);
        }
    }
    return check;
}

void AllocationContext::commit(core::TaskIndex task, core::SlotIndex start) {
    if (completed_.at(task)) {
        throw core::SchedulingError("task '" + tasks_[task].id + "' is already placed");
    }
    if (!check_window(task, start).free()) {
        throw core::SchedulingError("window of task '" + tasks_[task].id + "' is not free");
    }

    core::Minutes length = effort(task);
    auto task_end = start + static_cast<core::SlotIndex>(length);
    for (core::SlotIndex i = start; i < task_end; ++i) {
        grid_.assign(i, task);
    }
    for (core::SlotIndex i = task_end; i < rest_end(start, length); ++i) {
        grid_.reserve_rest(i, task);
    }

    auto& t = tasks_[task];
    core::Minute begin = grid_.slot(start).start;
    t.assigned = core::Interval{begin, begin + length};
    if (t.fixed && *t.fixed != *t.assigned) {
        t.rescheduled = true;
    }

    completed_[task] = true;
    start_slot_[task] = start;
    failure_[task].reset();
    placed_.push_back(task);

    trace(begin, [&](core::TraceWriter& w) {
        w.type("task_placed");
        w.field("task", std::string_view(t.id));
        w.field("start", static_cast<std::int64_t>(t.assigned->start));
        w.field("end", static_cast<std::int64_t>(t.assigned->end));
        w.field("priority", static_cast<std::int64_t>(t.priority));
        if (t.rescheduled) {
            w.field("rescheduled", std::string_view("yes"));
        }
    });
}

void AllocationContext::release(core::TaskIndex task) {
    auto start = start_slot_.at(task);
    if (!start) {
        return;
    }
    core::Minutes length = effort(task);
    grid_.release(*start, rest_end(*start, length), task);

    tasks_[task].assigned.reset();
    completed_[task] = false;
    start_slot_[task].reset();
    placed_.erase(std::remove(placed_.begin(), placed_.end(), task), placed_.end());
}

void AllocationContext::unassign(core::TaskIndex task) {
    release(task);
}

std::vector<core::TaskIndex> AllocationContext::evict(std::span<const core::TaskIndex> victims) {
    // Closure over placed dependents: a dependent must never outlive the
    // placement of what it depends on.
    std::vector<core::TaskIndex> closure;
    std::vector<bool> seen(tasks_.size(), false);
    std::vector<core::TaskIndex> worklist(victims.begin(), victims.end());
    while (!worklist.empty()) {
        core::TaskIndex current = worklist.back();
        worklist.pop_back();
        if (seen[current] || !completed_[current]) {
            continue;
        }
        seen[current] = true;
        closure.push_back(current);
        for (core::TaskIndex dependent : graph_.dependents(current)) {
            worklist.push_back(dependent);
        }
    }

    for (core::TaskIndex victim : closure) {
        auto& t = tasks_[victim];
        core::Minute where = t.assigned->start;
        release(victim);
        evicted_[victim] = true;
        ++eviction_count_;

        trace(where, [&](core::TraceWriter& w) {
            w.type("task_evicted");
            w.field("task", std::string_view(t.id));
            w.field("priority", static_cast<std::int64_t>(t.priority));
        });
        mark_rescheduled(victim);
    }

    TaskQueue::sort(tasks_, graph_, closure);
    return closure;
}

void AllocationContext::mark_rescheduled(core::TaskIndex task) {
    auto& t = tasks_.at(task);
    if (t.rescheduled) {
        return;
    }
    t.rescheduled = true;
    trace([&](core::TraceWriter& w) {
        w.type("task_rescheduled");
        w.field("task", std::string_view(t.id));
    });
}

void AllocationContext::record_failure(core::TaskIndex task, core::FailureReason reason) {
    failure_.at(task) = reason;
}

} // namespace slotplan::algo

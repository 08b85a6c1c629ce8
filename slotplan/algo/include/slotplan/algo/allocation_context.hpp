#pragma once

#include <slotplan/algo/dependency_graph.hpp>

#include <slotplan/core/error.hpp>
#include <slotplan/core/slot_grid.hpp>
#include <slotplan/core/task.hpp>
#include <slotplan/core/trace_writer.hpp>
#include <slotplan/core/types.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <utility>
#include <variant>
#include <vector>

namespace slotplan::algo {

/// @brief Range of candidate start slots for a task, both ends inclusive.
/// @ingroup algo_allocation
struct FeasibleWindow {
    core::SlotIndex first{0};  ///< Earliest start allowed by dependencies.
    core::SlotIndex last{0};   ///< Latest start allowed by deadline and grid end.
};

/// @brief Outcome of inspecting one candidate window.
/// @ingroup algo_allocation
struct WindowCheck {
    bool blocked{false};                      ///< Hard failure: break, gap, or grid end.
    std::vector<core::TaskIndex> conflicts;   ///< Distinct tasks occupying the window.

    /// @brief True if the window can be committed as is.
    [[nodiscard]] bool free() const noexcept { return !blocked && conflicts.empty(); }
};

/// @brief All mutable state of one allocation run.
/// @ingroup algo_allocation
///
/// Owns the SlotGrid and the completed-set, and references the caller's
/// task collection. Every placement strategy works through the primitives
/// below, so grid occupancy, task annotations, the placed list and the
/// completed-set never drift apart:
///  - commit() occupies the task slots and the trailing rest,
///  - unassign() undoes a commit without side effects (search backtracking),
///  - evict() undoes commits as a displacement: the tasks and every placed
///    dependent of them are freed and flagged rescheduled.
///
/// A context is bound to exactly one run; it is neither copyable nor
/// movable.
///
/// @see GreedyPlacer, FixedInserter, LatenessRefiner, BacktrackingSearch
class AllocationContext {
public:
    /// @param tasks   Task collection, annotated in place.
    /// @param graph   Dependency graph built from @p tasks.
    /// @param config  Grid parameters.
    /// @param writer  Optional trace sink (not owned).
    /// @throws core::GridConfigurationError  If @p config is invalid.
    AllocationContext(std::vector<core::Task>& tasks,
                      const DependencyGraph& graph,
                      const core::GridConfig& config,
                      core::TraceWriter* writer = nullptr);

    AllocationContext(const AllocationContext&) = delete;
    AllocationContext& operator=(const AllocationContext&) = delete;
    AllocationContext(AllocationContext&&) = delete;
    AllocationContext& operator=(AllocationContext&&) = delete;

    [[nodiscard]] const core::SlotGrid& grid() const noexcept { return grid_; }
    [[nodiscard]] const DependencyGraph& graph() const noexcept { return graph_; }
    [[nodiscard]] std::span<const core::Task> tasks() const noexcept { return tasks_; }
    [[nodiscard]] const core::Task& task(core::TaskIndex index) const { return tasks_.at(index); }

    /// @brief Membership in the completed-set.
    [[nodiscard]] bool is_completed(core::TaskIndex task) const { return completed_.at(task); }

    /// @brief True if every dependency of @p task is in the completed-set.
    [[nodiscard]] bool dependencies_completed(core::TaskIndex task) const;

    /// @brief Placed tasks in placement order.
    [[nodiscard]] std::span<const core::TaskIndex> placed() const noexcept { return placed_; }

    /// @brief First slot of a placed task.
    [[nodiscard]] std::optional<core::SlotIndex> start_slot(core::TaskIndex task) const {
        return start_slot_.at(task);
    }

    /// @brief Candidate start range of a flexible placement.
    ///
    /// Lower bound: first slot at or after the task's earliest start and the
    /// latest end among the dependencies. Upper bound: the latest start such
    /// that the task and its rest end by the deadline and before any placed
    /// dependent starts, that it is not after the task's latest start, and
    /// that the task still fits in the grid.
    ///
    /// @return The window, or the reason none exists (DependencyUnplaced,
    ///         DeadlineUnreachable, NoFreeWindow, MissingEffort).
    [[nodiscard]] std::variant<FeasibleWindow, core::FailureReason>
    feasible_window(core::TaskIndex task) const;

    /// @brief Inspect the window of @p task starting at slot @p start.
    ///
    /// The task portion must be a contiguous run without any break. The rest
    /// portion may overlap periodic breaks and is cut at the end of the
    /// working block. Task occupants other than @p task are collected as
    /// conflicts; any other break makes the window blocked.
    [[nodiscard]] WindowCheck check_window(core::TaskIndex task, core::SlotIndex start) const;

    /// @brief Place @p task at slot @p start.
    /// @throws core::SchedulingError  If the window is not free.
    void commit(core::TaskIndex task, core::SlotIndex start);

    /// @brief Undo a placement as if it had never happened.
    void unassign(core::TaskIndex task);

    /// @brief Evict @p victims and, transitively, their placed dependents.
    /// @return Every evicted task, in priority order.
    std::vector<core::TaskIndex> evict(std::span<const core::TaskIndex> victims);

    /// @brief True if @p task has been evicted at least once in this run.
    [[nodiscard]] bool was_evicted(core::TaskIndex task) const { return evicted_.at(task); }

    /// @brief Total number of evictions performed.
    [[nodiscard]] std::size_t eviction_count() const noexcept { return eviction_count_; }

    /// @brief Flag @p task as moved away from its fixed or first placement.
    void mark_rescheduled(core::TaskIndex task);

    /// @brief Remember why the latest attempt to place @p task failed.
    void record_failure(core::TaskIndex task, core::FailureReason reason);

    [[nodiscard]] std::optional<core::FailureReason> failure(core::TaskIndex task) const {
        return failure_.at(task);
    }

    /// @brief Emit a trace record if a writer is installed.
    /// @tparam F Callable with signature void(core::TraceWriter&).
    template<typename F>
    void trace(core::Minute time, F&& func) const;

    /// @brief Emit a run-level trace record (stamped at minute 0).
    template<typename F>
    void trace(F&& func) const { trace(0, std::forward<F>(func)); }

private:
    [[nodiscard]] core::Minutes effort(core::TaskIndex task) const;
    [[nodiscard]] core::SlotIndex rest_end(core::SlotIndex start, core::Minutes length) const;
    void release(core::TaskIndex task);

    std::vector<core::Task>& tasks_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    const DependencyGraph& graph_;    // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    core::SlotGrid grid_;
    core::TraceWriter* writer_;

    std::vector<bool> completed_;
    std::vector<core::TaskIndex> placed_;
    std::vector<std::optional<core::SlotIndex>> start_slot_;
    std::vector<bool> evicted_;
    std::vector<std::optional<core::FailureReason>> failure_;
    std::size_t eviction_count_{0};
};

template<typename F>
void AllocationContext::trace(core::Minute time, F&& func) const {
    if (writer_) {
        writer_->begin(time);
        func(*writer_);
        writer_->end();
    }
}

} // namespace slotplan::algo

#pragma once

#include <slotplan/algo/dependency_graph.hpp>

#include <slotplan/core/task.hpp>
#include <slotplan/core/types.hpp>

#include <cstddef>
#include <deque>
#include <span>
#include <vector>

namespace slotplan::algo {

/// @brief Processing queue of tasks in priority order.
/// @ingroup algo_ordering
///
/// Ordered by descending priority, then ascending count of known, distinct
/// dependencies (as resolved by the DependencyGraph), then input position. The dependency-count key is only a tie-break heuristic:
/// readiness is enforced by the allocator, which pops the front task and
/// defers it to the back when its dependencies are not placed yet.
///
/// Priorities are read once at construction; later boosts are not seen.
class TaskQueue {
public:
    /// @brief Build the queue over a subset of tasks.
    /// @param tasks       Whole task collection.
    /// @param graph       Dependency graph built from @p tasks.
    /// @param candidates  Indices into @p tasks to enqueue.
    TaskQueue(std::span<const core::Task> tasks, const DependencyGraph& graph,
              std::span<const core::TaskIndex> candidates);

    /// @brief Build the queue over every task of the collection.
    TaskQueue(std::span<const core::Task> tasks, const DependencyGraph& graph);

    [[nodiscard]] bool empty() const noexcept { return queue_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return queue_.size(); }

    /// @brief Highest-priority remaining task.
    /// @throws core::SchedulingError  If the queue is empty.
    [[nodiscard]] core::TaskIndex front() const;

    /// @brief Remove and return the highest-priority remaining task.
    /// @throws core::SchedulingError  If the queue is empty.
    core::TaskIndex pop();

    /// @brief Send a task to the lowest-priority end to retry later.
    void defer(core::TaskIndex task);

    /// @brief Snapshot of the current order, front first.
    [[nodiscard]] std::vector<core::TaskIndex> order() const;

    /// @brief Sort @p candidates with the queue's ordering key.
    static void sort(std::span<const core::Task> tasks, const DependencyGraph& graph,
                     std::vector<core::TaskIndex>& candidates);

private:
    std::deque<core::TaskIndex> queue_;
};

} // namespace slotplan::algo

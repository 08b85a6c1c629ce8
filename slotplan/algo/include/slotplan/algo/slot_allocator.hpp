#pragma once

#include <slotplan/core/error.hpp>
#include <slotplan/core/slot_grid.hpp>
#include <slotplan/core/task.hpp>
#include <slotplan/core/trace_writer.hpp>
#include <slotplan/core/types.hpp>

#include <cstddef>
#include <vector>

namespace slotplan::algo {

/// @brief Strategy switches of an allocation run.
/// @ingroup algo_allocation
struct AllocatorOptions {
    bool refine_lateness{false};             ///< Run the lateness-minimising pass before greedy placement.
    bool backtracking{true};                 ///< Search for the leftovers after greedy placement.
    std::size_t search_node_limit{200000};   ///< Bound on backtracking nodes per run.
};

/// @brief A task that ended the run without a placement.
/// @ingroup algo_allocation
struct UnplacedTask {
    core::TaskIndex task{0};
    core::FailureReason reason{core::FailureReason::NoFreeWindow};
};

/// @brief Summary of one allocation run.
///
/// Every input task appears exactly once, either in @c placed or in
/// @c unplaced. Placement windows themselves are written on the tasks.
///
/// @ingroup algo_allocation
struct AllocationReport {
    std::vector<core::TaskIndex> placed;   ///< Placed tasks, in placement order.
    std::vector<UnplacedTask> unplaced;    ///< Unplaced tasks with their reason.
    std::size_t rescheduled{0};            ///< Tasks flagged rescheduled.
    std::size_t evictions{0};              ///< Eviction count, cascades included.
    std::size_t search_nodes{0};           ///< Nodes expanded by the backtracking search.
    bool search_bounded{false};            ///< The search hit its node limit.

    /// @brief True if every task was placed.
    [[nodiscard]] bool complete() const noexcept { return unplaced.empty(); }
};

/// @brief Entry point of the allocation engine.
///
/// One run proceeds in phases over a fresh grid:
///  1. dependency graph, cycle detection and priority propagation,
///  2. fixed tasks inserted at their window, in queue order,
///  3. optional lateness refinement of deadline tasks,
///  4. greedy placement of flexible and displaced tasks, deferring tasks
///     whose dependencies are not placed until a full pass makes no progress,
///  5. backtracking search over the leftovers,
///  6. a consistency sweep that unplaces any task placed before one of its
///     dependencies.
///
/// The allocator keeps no per-run state; one instance can serve any number
/// of sequential runs.
///
/// @see AllocationContext
class SlotAllocator {
public:
    /// @throws core::GridConfigurationError  If @p config is invalid.
    explicit SlotAllocator(core::GridConfig config, AllocatorOptions options = {});

    [[nodiscard]] const core::GridConfig& config() const noexcept { return config_; }
    [[nodiscard]] const AllocatorOptions& options() const noexcept { return options_; }

    /// @brief Allocate @p tasks onto the weekly grid.
    ///
    /// Priorities are propagated in place, and every task gets its
    /// @c assigned window and @c rescheduled flag rewritten.
    ///
    /// @param tasks   Task set, annotated in place.
    /// @param writer  Optional trace sink (not owned).
    /// @throws core::DependencyCycleError  If the dependency graph has a cycle.
    /// @throws core::UnknownTaskError      If two tasks share an id.
    AllocationReport allocate(std::vector<core::Task>& tasks, core::TraceWriter* writer = nullptr) const;

private:
    core::GridConfig config_;
    AllocatorOptions options_;
};

} // namespace slotplan::algo

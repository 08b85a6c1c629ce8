#pragma once

#include <slotplan/algo/allocation_context.hpp>
#include <slotplan/algo/greedy_placer.hpp>

#include <slotplan/core/types.hpp>

namespace slotplan::algo {

/// @brief Result of inserting a fixed task at its own window.
/// @ingroup algo_allocation
enum class FixedOutcome {
    Placed,        ///< Placed exactly at the fixed window.
    Displaced,     ///< Window unusable; hand the task to greedy placement.
    Unschedulable  ///< Hard failure; reason recorded on the context.
};

/// @brief Places fixed tasks exactly at their caller-imposed windows.
/// @ingroup algo_allocation
///
/// The window plus its trailing rest is checked slot by slot. Conflicting
/// tasks are evicted, together with their placed dependents, and re-placed
/// through the GreedyPlacer. A window that touches a break, crosses the end
/// of a working block, or collides with a task that holds its own fixed
/// window at an equal or higher priority is not forced: the task is flagged
/// rescheduled and returned as Displaced.
///
/// A window that lies entirely outside working hours cannot be moved onto
/// the grid and yields OutsideWorkingHours.
class FixedInserter {
public:
    FixedInserter(AllocationContext& context, GreedyPlacer& greedy);

    /// @brief Insert one fixed task.
    /// @throws core::SchedulingError  If @p task carries no fixed window.
    FixedOutcome insert(core::TaskIndex task);

    /// @brief True if fixed task @p task may evict @p victim.
    [[nodiscard]] bool can_evict(core::TaskIndex task, core::TaskIndex victim) const;

private:
    [[nodiscard]] bool touches_grid(const core::Interval& window) const;
    FixedOutcome displace(core::TaskIndex task);

    AllocationContext& context_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    GreedyPlacer& greedy_;        // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
};

} // namespace slotplan::algo

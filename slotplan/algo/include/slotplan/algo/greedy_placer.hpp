#pragma once

#include <slotplan/algo/allocation_context.hpp>

#include <slotplan/core/types.hpp>

#include <vector>

namespace slotplan::algo {

/// @brief Result of a single placement attempt.
/// @ingroup algo_allocation
enum class PlacementOutcome {
    Placed,    ///< The task now occupies a window.
    NotReady,  ///< A dependency is not placed yet; retry later.
    Failed     ///< No window can be made to fit; reason recorded on the context.
};

/// @brief First-fit placement of flexible tasks with cascading eviction.
/// @ingroup algo_allocation
///
/// Scans the feasible window of a task in ascending slot order and commits
/// the first start whose window is either free, or occupied only by tasks
/// this task may evict. Evicted tasks are re-placed immediately, in
/// priority order; those that cannot be re-placed are kept in a displaced
/// list for the caller to retry.
///
/// A task may only evict tasks of strictly lower priority that are neither
/// sitting at their own fixed window nor direct dependencies of it. Since
/// priorities strictly decrease along any eviction chain, cascades always
/// terminate.
///
/// @see FixedInserter, AllocationContext::evict
class GreedyPlacer {
public:
    explicit GreedyPlacer(AllocationContext& context);

    /// @brief Try to place @p task.
    PlacementOutcome place(core::TaskIndex task);

    /// @brief Re-place evicted tasks, dependencies first.
    ///
    /// Every task of @p evicted is flagged rescheduled. Tasks that are still
    /// unplaced afterwards are appended to the displaced list.
    void replace(std::vector<core::TaskIndex> evicted);

    /// @brief True if @p task is allowed to evict @p victim.
    [[nodiscard]] bool can_evict(core::TaskIndex task, core::TaskIndex victim) const;

    /// @brief Hand over the tasks that could not be re-placed so far.
    [[nodiscard]] std::vector<core::TaskIndex> take_displaced();

    /// @brief Forget the displaced list.
    ///
    /// For phase boundaries where the next phase rebuilds its work list from
    /// every task not yet placed, which already includes the displaced ones.
    void drop_displaced() noexcept { displaced_.clear(); }

private:
    AllocationContext& context_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::vector<core::TaskIndex> displaced_;
};

} // namespace slotplan::algo

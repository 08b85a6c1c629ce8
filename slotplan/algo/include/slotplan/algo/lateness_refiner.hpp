#pragma once

#include <slotplan/algo/allocation_context.hpp>
#include <slotplan/algo/greedy_placer.hpp>

#include <slotplan/core/types.hpp>

#include <cstddef>
#include <vector>

namespace slotplan::algo {

/// @brief Optional placement pass minimising total lateness of deadline tasks.
/// @ingroup algo_allocation
///
/// Candidates are the unplaced flexible tasks that carry a deadline and whose
/// dependencies are all placed. They are taken in earliest-deadline-first
/// order and packed back to back onto a compressed timeline made of the
/// currently free slots. The table
///
///     dp[i][t] = least cumulative lateness using the first i candidates
///                with exactly t free slots consumed
///
/// chooses which candidates to include; a candidate that is left out costs
/// one full week of lateness, so the subset only shrinks when a task cannot
/// fit at all. Chosen tasks are then committed in deadline order through
/// GreedyPlacer::place(), which still enforces every hard constraint.
///
/// The pass never touches a task that is already placed.
class LatenessRefiner {
public:
    LatenessRefiner(AllocationContext& context, GreedyPlacer& greedy);

    /// @brief Candidates in earliest-deadline-first order.
    [[nodiscard]] std::vector<core::TaskIndex> select() const;

    /// @brief Solve the table over @p candidates (already in deadline order).
    /// @return The chosen subset, in deadline order.
    [[nodiscard]] std::vector<core::TaskIndex> plan(const std::vector<core::TaskIndex>& candidates) const;

    /// @brief Run select(), plan() and commit the chosen tasks.
    /// @return Number of tasks placed by this pass.
    std::size_t refine();

private:
    AllocationContext& context_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    GreedyPlacer& greedy_;        // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
};

} // namespace slotplan::algo

#pragma once

#include <slotplan/algo/allocation_context.hpp>

#include <slotplan/core/types.hpp>

#include <cstddef>
#include <set>
#include <span>
#include <utility>
#include <vector>

namespace slotplan::algo {

/// @brief Outcome of a backtracking run.
/// @ingroup algo_allocation
struct SearchResult {
    std::vector<core::TaskIndex> placed;     ///< Tasks placed by the search, in search order.
    std::vector<core::TaskIndex> abandoned;  ///< Tasks given up on; reason recorded on the context.
    std::size_t nodes{0};                    ///< Search nodes expanded over all attempts.
    bool bounded{false};                     ///< True if the node limit stopped the search.
};

/// @brief Last-resort exhaustive placement of the leftover tasks.
/// @ingroup algo_allocation
///
/// Depth-first search over the pending set. At every node each ready task
/// (all dependencies placed) is tried at each candidate start: the earliest
/// free start of every free run inside its feasible window. A placement is
/// committed on the shared context and undone with
/// AllocationContext::unassign() when the branch fails.
///
/// States are keyed by the sorted list of (task, start slot) pairs placed so
/// far; a key that already failed is not expanded again.
///
/// When the full set cannot be placed, the lowest-ranked task and its
/// dependents in the set are abandoned and the search restarts on the rest.
/// Reaching the node limit rolls back every placement of the current attempt
/// and abandons the remaining tasks with SearchExhausted.
///
/// Ranking: priority descending, earlier deadline first (tasks without a
/// deadline last), longer effort first, then input order.
class BacktrackingSearch {
public:
    /// @param context     Allocation state shared with the other phases.
    /// @param node_limit  Maximum number of expanded nodes over the whole run.
    BacktrackingSearch(AllocationContext& context, std::size_t node_limit);

    /// @brief Rank @p tasks by the search heuristic.
    [[nodiscard]] std::vector<core::TaskIndex> order(std::span<const core::TaskIndex> tasks) const;

    /// @brief Place as many of @p pending as the search can.
    SearchResult run(std::span<const core::TaskIndex> pending);

private:
    enum class Outcome { Solved, Failed, Aborted };

    using Placement = std::pair<core::TaskIndex, core::SlotIndex>;
    using StateKey = std::vector<Placement>;

    Outcome solve();
    [[nodiscard]] std::vector<core::SlotIndex> candidate_starts(core::TaskIndex task) const;
    [[nodiscard]] StateKey state_key() const;
    void abandon(core::TaskIndex task, core::FailureReason reason, SearchResult& result);
    void rollback();

    AllocationContext& context_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    std::size_t node_limit_;
    std::size_t nodes_{0};

    std::vector<core::TaskIndex> set_;
    std::vector<Placement> trail_;
    std::set<StateKey> failed_;
};

} // namespace slotplan::algo

#pragma once

#include <slotplan/algo/dependency_graph.hpp>

#include <slotplan/core/task.hpp>
#include <slotplan/core/trace_writer.hpp>

#include <vector>

namespace slotplan::algo {

/// @brief Fail fast if the dependency relation contains a cycle.
///
/// Iterative three-colour depth-first search over the whole graph.
///
/// @param tasks  Task collection the graph was built from (for identifiers).
/// @param graph  Dependency graph of @p tasks.
/// @throws core::DependencyCycleError  With the identifiers along the first
///         cycle found, closed on its first task.
/// @ingroup algo_ordering
void check_acyclic(const std::vector<core::Task>& tasks, const DependencyGraph& graph);

/// @brief Raise every dependency's priority to at least its dependents'.
///
/// For each task T, every task reachable from T through dependency edges
/// ends with a priority >= T's current priority. The walk is an explicit
/// worklist with a visited set per source task, so it terminates even on
/// a cyclic graph. Running it twice yields the same priorities as once.
///
/// @param tasks   Task collection; priorities are updated in place.
/// @param graph   Dependency graph of @p tasks.
/// @param writer  Optional trace sink; one `priority_boosted` record per raise.
/// @ingroup algo_ordering
void propagate_priorities(std::vector<core::Task>& tasks,
                          const DependencyGraph& graph,
                          core::TraceWriter* writer = nullptr);

/// @brief Convenience overload: build the graph, reject cycles, propagate.
/// @throws core::DependencyCycleError   On a cyclic graph.
/// @throws core::UnknownTaskError       On duplicate identifiers.
/// @ingroup algo_ordering
void propagate_priorities(std::vector<core::Task>& tasks);

} // namespace slotplan::algo

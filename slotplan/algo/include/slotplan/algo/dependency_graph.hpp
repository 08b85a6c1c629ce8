#pragma once

#include <slotplan/core/task.hpp>
#include <slotplan/core/types.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace slotplan::algo {

/// @brief Index-addressed view of the dependency relation of a task set.
/// @ingroup algo_ordering
///
/// Translates the string identifiers of core::Task into stable TaskIndex
/// handles once, so later phases never look tasks up by name. Duplicate
/// entries in a dependency list are collapsed. Identifiers that do not
/// name a task of the set are kept aside in unknown_dependencies().
///
/// @see check_acyclic, propagate_priorities
class DependencyGraph {
public:
    /// @brief Build the graph.
    /// @param tasks  The task collection; indices refer to positions in it.
    /// @throws core::UnknownTaskError  If two tasks share an identifier.
    explicit DependencyGraph(std::span<const core::Task> tasks);

    [[nodiscard]] std::size_t size() const noexcept { return dependencies_.size(); }

    /// @brief Look up a task by identifier.
    [[nodiscard]] std::optional<core::TaskIndex> find(std::string_view id) const;

    /// @brief Look up a task by identifier.
    /// @throws core::UnknownTaskError  If @p id is not in the set.
    [[nodiscard]] core::TaskIndex index_of(std::string_view id) const;

    /// @brief Direct dependencies of @p task (tasks that must finish first).
    [[nodiscard]] std::span<const core::TaskIndex> dependencies(core::TaskIndex task) const {
        return dependencies_.at(task);
    }

    /// @brief Direct dependents of @p task (tasks waiting on it).
    [[nodiscard]] std::span<const core::TaskIndex> dependents(core::TaskIndex task) const {
        return dependents_.at(task);
    }

    /// @brief Identifiers listed by @p task that name no task of the set.
    [[nodiscard]] std::span<const std::string> unknown_dependencies(core::TaskIndex task) const {
        return unknown_.at(task);
    }

    /// @brief True if @p dependency is a direct dependency of @p task.
    [[nodiscard]] bool depends_on(core::TaskIndex task, core::TaskIndex dependency) const;

private:
    std::unordered_map<std::string, core::TaskIndex> ids_;
    std::vector<std::vector<core::TaskIndex>> dependencies_;
    std::vector<std::vector<core::TaskIndex>> dependents_;
    std::vector<std::vector<std::string>> unknown_;
};

} // namespace slotplan::algo

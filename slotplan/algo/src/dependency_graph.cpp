#include <slotplan/algo/dependency_graph.hpp>

#include <slotplan/core/error.hpp>

#include <algorithm>

namespace slotplan::algo {

DependencyGraph::DependencyGraph(std::span<const core::Task> tasks)
    : dependencies_(tasks.size())
    , dependents_(tasks.size())
    , unknown_(tasks.size()) {
    for (core::TaskIndex i = 0; i < tasks.size(); ++i) {
        auto [it, inserted] = ids_.emplace(tasks[i].id, i);
        if (!inserted) {
            throw core::UnknownTaskError("duplicate task id '" + tasks[i].id + "'");
        }
    }

    for (core::TaskIndex i = 0; i < tasks.size(); ++i) {
        for (const auto& dep_id : tasks[i].dependencies) {
            auto it = ids_.find(dep_id);
            if (it == ids_.end()) {
                unknown_[i].push_back(dep_id);
                continue;
            }
            auto& deps = dependencies_[i];
            if (std::find(deps.begin(), deps.end(), it->second) == deps.end()) {
                deps.push_back(it->second);
                dependents_[it->second].push_back(i);
            }
        }
    }
}

std::optional<core::TaskIndex> DependencyGraph::find(std::string_view id) const {
    auto it = ids_.find(std::string(id));
    if (it == ids_.end()) {
        return std::nullopt;
    }
    return it->second;
}

core::TaskIndex DependencyGraph::index_of(std::string_view id) const {
    auto idx = find(id);
    if (!idx) {
        throw core::UnknownTaskError("unknown task id '" + std::string(id) + "'");
    }
    return *idx;
}

bool DependencyGraph::depends_on(core::TaskIndex task, core::TaskIndex dependency) const {
    const auto& deps = dependencies_.at(task);
    return std::find(deps.begin(), deps.end(), dependency) != deps.end();
}

} // namespace slotplan::algo

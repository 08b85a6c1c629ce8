#include <slotplan/algo/task_queue.hpp>

#include <slotplan/core/error.hpp>

#include <algorithm>
#include <numeric>

namespace slotplan::algo {

void TaskQueue::sort(std::span<const core::Task> tasks, const DependencyGraph& graph,
                     std::vector<core::TaskIndex>& candidates) {
    std::stable_sort(candidates.begin(), candidates.end(),
        [&tasks, &graph](core::TaskIndex lhs, core::TaskIndex rhs) {
            const auto& a = tasks[lhs];
            const auto& b = tasks[rhs];
            if (a.priority != b.priority) {
                return a.priority > b.priority;
            }
            auto a_deps = graph.dependencies(lhs).size();
            auto b_deps = graph.dependencies(rhs).size();
            if (a_deps != b_deps) {
                return a_deps < b_deps;
            }
            return lhs < rhs;
        });
}

TaskQueue::TaskQueue(std::span<const core::Task> tasks, const DependencyGraph& graph,
                     std::span<const core::TaskIndex> candidates) {
    std::vector<core::TaskIndex> ordered(candidates.begin(), candidates.end());
    sort(tasks, graph, ordered);
    queue_.assign(ordered.begin(), ordered.end());
}

TaskQueue::TaskQueue(std::span<const core::Task> tasks, const DependencyGraph& graph) {
    std::vector<core::TaskIndex> ordered(tasks.size());
    std::iota(ordered.begin(), ordered.end(), core::TaskIndex{0});
    sort(tasks, graph, ordered);
    queue_.assign(ordered.begin(), ordered.end());
}

core::TaskIndex TaskQueue::front() const {
    if (queue_.empty()) {
        throw core::SchedulingError("front() on an empty task queue");
    }
    return queue_.front();
}

core::TaskIndex TaskQueue::pop() {
    core::TaskIndex task = front();
    queue_.pop_front();
    return task;
}

void TaskQueue::defer(core::TaskIndex task) {
    queue_.push_back(task);
}

std::vector<core::TaskIndex> TaskQueue::order() const {
    return {queue_.begin(), queue_.end()};
}

} // namespace slotplan::algo

#include <slotplan/algo/priority_propagator.hpp>

#include <slotplan/core/error.hpp>

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>

namespace slotplan::algo {

namespace {

enum class Colour : std::uint8_t { White, Grey, Black };

} // anonymous namespace

void check_acyclic(const std::vector<core::Task>& tasks, const DependencyGraph& graph) {
    std::vector<Colour> colour(graph.size(), Colour::White);
    std::vector<core::TaskIndex> parent(graph.size(), 0);

    // Each frame is (task, position of the next dependency to visit)
    std::vector<std::pair<core::TaskIndex, std::size_t>> stack;

    for (core::TaskIndex root = 0; root < graph.size(); ++root) {
        if (colour[root] != Colour::White) {
            continue;
        }
        colour[root] = Colour::Grey;
        stack.emplace_back(root, 0);

        while (!stack.empty()) {
            auto& [node, next] = stack.back();
            auto deps = graph.dependencies(node);

            if (next == deps.size()) {
                colour[node] = Colour::Black;
                stack.pop_back();
                continue;
            }

            core::TaskIndex dep = deps[next++];
            if (colour[dep] == Colour::White) {
                colour[dep] = Colour::Grey;
                parent[dep] = node;
                stack.emplace_back(dep, 0);
            } else if (colour[dep] == Colour::Grey) {
                // Back edge node -> dep closes a cycle through the grey path
                std::vector<std::string> cycle{tasks[dep].id};
                for (core::TaskIndex walk = node; walk != dep; walk = parent[walk]) {
                    cycle.push_back(tasks[walk].id);
                }
                cycle.push_back(tasks[dep].id);
                std::reverse(cycle.begin(), cycle.end());
                throw core::DependencyCycleError(std::move(cycle));
            }
        }
    }
}

void propagate_priorities(std::vector<core::Task>& tasks,
                          const DependencyGraph& graph,
                          core::TraceWriter* writer) {
    std::vector<bool> visited(tasks.size());
    std::vector<core::TaskIndex> worklist;

    for (core::TaskIndex source = 0; source < tasks.size(); ++source) {
        const int floor = tasks[source].priority;

        std::fill(visited.begin(), visited.end(), false);
        visited[source] = true;
        worklist.assign(graph.dependencies(source).begin(), graph.dependencies(source).end());

        while (!worklist.empty()) {
            core::TaskIndex dep = worklist.back();
            worklist.pop_back();
            if (visited[dep]) {
                continue;
            }
            visited[dep] = true;

            auto& task = tasks[dep];
            if (task.priority < floor) {
                if (writer != nullptr) {
                    writer->begin(0);
                    writer->type("priority_boosted");
                    writer->field("task", std::string_view(task.id));
                    writer->field("from", static_cast<std::int64_t>(task.priority));
                    writer->field("to", static_cast<std::int64_t>(floor));
                    writer->field("because", std::string_view(tasks[source].id));
                    writer->end();
                }
                task.priority = floor;
            }

            for (core::TaskIndex next : graph.dependencies(dep)) {
                if (!visited[next]) {
                    worklist.push_back(next);
                }
            }
        }
    }
}

void propagate_priorities(std::vector<core::Task>& tasks) {
    DependencyGraph graph(tasks);
    check_acyclic(tasks, graph);
    propagate_priorities(tasks, graph);
}

} // namespace slotplan::algo

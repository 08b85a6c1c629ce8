#include <slotplan/algo/task_queue.hpp>
#include <slotplan/algo/dependency_graph.hpp>

#include <slotplan/core/error.hpp>
#include <slotplan/core/task.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace slotplan::algo;
using namespace slotplan::core;

class TaskQueueTest : public ::testing::Test {
protected:
    static Task task(std::string id, int priority, std::vector<std::string> deps = {}) {
        Task t;
        t.id = std::move(id);
        t.priority = priority;
        t.dependencies = std::move(deps);
        t.duration = 30;
        return t;
    }

    static std::vector<TaskIndex> order_of(const std::vector<Task>& tasks) {
        DependencyGraph graph(tasks);
        return TaskQueue(tasks, graph).order();
    }
};

TEST_F(TaskQueueTest, HighestPriorityFirst) {
    std::vector<Task> tasks{task("low", 1), task("high", 9), task("mid", 5)};
    EXPECT_EQ(order_of(tasks), (std::vector<TaskIndex>{1, 2, 0}));
}

TEST_F(TaskQueueTest, FewerDependenciesBreakTies) {
    std::vector<Task> tasks{task("a", 3, {"b", "c"}), task("b", 3, {"c"}), task("c", 3)};
    EXPECT_EQ(order_of(tasks), (std::vector<TaskIndex>{2, 1, 0}));
}

TEST_F(TaskQueueTest, InputOrderIsFinalTieBreak) {
    std::vector<Task> tasks{task("x", 2), task("y", 2), task("z", 2)};
    EXPECT_EQ(order_of(tasks), (std::vector<TaskIndex>{0, 1, 2}));
}

TEST_F(TaskQueueTest, SubsetConstructor) {
    std::vector<Task> tasks{task("a", 1), task("b", 7), task("c", 4), task("d", 8)};
    std::vector<TaskIndex> candidates{0, 2, 1};
    DependencyGraph graph(tasks);
    TaskQueue queue(tasks, graph, candidates);
    EXPECT_EQ(queue.size(), 3U);
    EXPECT_EQ(queue.order(), (std::vector<TaskIndex>{1, 2, 0}));
}

TEST_F(TaskQueueTest, PopAndDefer) {
    std::vector<Task> tasks{task("a", 3), task("b", 2), task("c", 1)};
    DependencyGraph graph(tasks);
    TaskQueue queue(tasks, graph);

    EXPECT_EQ(queue.front(), 0U);
    TaskIndex first = queue.pop();
    EXPECT_EQ(first, 0U);
    queue.defer(first);
    EXPECT_EQ(queue.order(), (std::vector<TaskIndex>{1, 2, 0}));

    EXPECT_EQ(queue.pop(), 1U);
    EXPECT_EQ(queue.pop(), 2U);
    EXPECT_EQ(queue.pop(), 0U);
    EXPECT_TRUE(queue.empty());
}

TEST_F(TaskQueueTest, EmptyQueueThrows) {
    std::vector<Task> tasks;
    DependencyGraph graph(tasks);
    TaskQueue queue(tasks, graph);
    EXPECT_TRUE(queue.empty());
    EXPECT_THROW((void)queue.front(), SchedulingError);
    EXPECT_THROW(queue.pop(), SchedulingError);
}

TEST_F(TaskQueueTest, StaticSortUsesSameKey) {
    std::vector<Task> tasks{task("a", 1), task("b", 5, {"a"}), task("c", 5)};
    std::vector<TaskIndex> indices{0, 1, 2};
    TaskQueue::sort(tasks, DependencyGraph(tasks), indices);
    EXPECT_EQ(indices, (std::vector<TaskIndex>{2, 1, 0}));
}

TEST_F(TaskQueueTest, OnlyDistinctKnownDependenciesCount) {
    // "a" lists one real dependency three times plus an id outside the set;
    // "b" has two real ones
    std::vector<Task> tasks{task("a", 3, {"c", "c", "ghost", "c"}), task("b", 3, {"c", "d"}),
                            task("c", 3), task("d", 3)};
    EXPECT_EQ(order_of(tasks), (std::vector<TaskIndex>{2, 3, 0, 1}));
}

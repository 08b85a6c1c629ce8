#include <slotplan/algo/allocation_context.hpp>
#include <slotplan/algo/dependency_graph.hpp>
#include <slotplan/algo/greedy_placer.hpp>

#include <slotplan/core/error.hpp>
#include <slotplan/core/slot_grid.hpp>
#include <slotplan/core/task.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace slotplan::algo;
using namespace slotplan::core;

class GreedyPlacerTest : public ::testing::Test {
protected:
    static GridConfig nine_to_five(Minutes rest = 0) {
        GridConfig config;
        config.working_start = 9 * 60;
        config.working_end = 17 * 60;
        config.break_interval = 0;
        config.break_duration = rest;
        return config;
    }

    TaskIndex add(std::string id, int priority, Minutes duration, std::vector<std::string> deps = {}) {
        Task t;
        t.id = std::move(id);
        t.priority = priority;
        t.duration = duration;
        t.dependencies = std::move(deps);
        tasks_.push_back(std::move(t));
        return tasks_.size() - 1;
    }

    void build(const GridConfig& config) {
        graph_ = std::make_unique<DependencyGraph>(tasks_);
        context_ = std::make_unique<AllocationContext>(tasks_, *graph_, config);
        greedy_ = std::make_unique<GreedyPlacer>(*context_);
    }

    [[nodiscard]] Minute start_of(TaskIndex task) const {
        EXPECT_TRUE(tasks_[task].assigned.has_value());
        return tasks_[task].assigned ? tasks_[task].assigned->start : -1;
    }

    std::vector<Task> tasks_;
    std::unique_ptr<DependencyGraph> graph_;
    std::unique_ptr<AllocationContext> context_;
    std::unique_ptr<GreedyPlacer> greedy_;
};

// =============================================================================
// Placement
// =============================================================================

TEST_F(GreedyPlacerTest, PlacesAtEarliestFreeMinute) {
    auto a = add("a", 1, 60);
    build(nine_to_five());
    EXPECT_EQ(greedy_->place(a), PlacementOutcome::Placed);
    EXPECT_EQ(*tasks_[a].assigned, (Interval{540, 600}));
}

TEST_F(GreedyPlacerTest, NextTaskWaitsForRest) {
    auto a = add("a", 1, 60);
    auto b = add("b", 1, 30);
    build(nine_to_five(15));
    ASSERT_EQ(greedy_->place(a), PlacementOutcome::Placed);
    ASSERT_EQ(greedy_->place(b), PlacementOutcome::Placed);
    EXPECT_EQ(start_of(b), 615);
}

TEST_F(GreedyPlacerTest, TaskTooLongForTheDayMovesOn) {
    auto a = add("a", 1, 300);
    auto b = add("b", 1, 300);
    build(nine_to_five());
    ASSERT_EQ(greedy_->place(a), PlacementOutcome::Placed);
    ASSERT_EQ(greedy_->place(b), PlacementOutcome::Placed);
    EXPECT_EQ(start_of(b), 1440 + 540);
}

TEST_F(GreedyPlacerTest, PlacingTwiceIsANoOp) {
    auto a = add("a", 1, 60);
    build(nine_to_five());
    ASSERT_EQ(greedy_->place(a), PlacementOutcome::Placed);
    EXPECT_EQ(greedy_->place(a), PlacementOutcome::Placed);
    EXPECT_EQ(context_->placed().size(), 1U);
}

// =============================================================================
// Dependencies and deadlines
// =============================================================================

TEST_F(GreedyPlacerTest, WaitsForDependencies) {
    auto a = add("a", 1, 60);
    auto b = add("b", 1, 30, {"a"});
    build(nine_to_five(10));

    EXPECT_EQ(greedy_->place(b), PlacementOutcome::NotReady);
    EXPECT_EQ(context_->failure(b), FailureReason::DependencyUnplaced);

    ASSERT_EQ(greedy_->place(a), PlacementOutcome::Placed);
    ASSERT_EQ(greedy_->place(b), PlacementOutcome::Placed);
    EXPECT_GE(start_of(b), tasks_[a].assigned->end + 10);
    EXPECT_FALSE(context_->failure(b).has_value());
}

TEST_F(GreedyPlacerTest, DeadlineBeforeGridFails) {
    auto a = add("a", 1, 60);
    tasks_[a].deadline = 300;
    build(nine_to_five());
    EXPECT_EQ(greedy_->place(a), PlacementOutcome::Failed);
    EXPECT_EQ(context_->failure(a), FailureReason::DeadlineUnreachable);
}

TEST_F(GreedyPlacerTest, DeadlineWindowTakenFails) {
    auto a = add("a", 5, 60);
    auto b = add("b", 5, 60);
    tasks_[b].deadline = 620;
    build(nine_to_five());
    ASSERT_EQ(greedy_->place(a), PlacementOutcome::Placed);
    EXPECT_EQ(greedy_->place(b), PlacementOutcome::Failed);
    EXPECT_EQ(context_->failure(b), FailureReason::NoFreeWindow);
    EXPECT_EQ(start_of(a), 540);
}

// =============================================================================
// Eviction
// =============================================================================

TEST_F(GreedyPlacerTest, EvictsLowerPriorityAndReplacesIt) {
    auto low = add("low", 1, 480);
    auto high = add("high", 5, 60);
    tasks_[high].deadline = 660;
    build(nine_to_five());

    ASSERT_EQ(greedy_->place(low), PlacementOutcome::Placed);
    ASSERT_EQ(greedy_->place(high), PlacementOutcome::Placed);

    EXPECT_EQ(start_of(high), 540);
    // Monday no longer has 480 free minutes
    EXPECT_EQ(start_of(low), 1440 + 540);
    EXPECT_TRUE(tasks_[low].rescheduled);
    EXPECT_FALSE(tasks_[high].rescheduled);
    EXPECT_EQ(context_->eviction_count(), 1U);
    EXPECT_TRUE(greedy_->take_displaced().empty());
}

TEST_F(GreedyPlacerTest, NeverEvictsEqualPriority) {
    auto first = add("first", 3, 480);
    auto second = add("second", 3, 60);
    tasks_[second].deadline = 660;
    build(nine_to_five());

    ASSERT_EQ(greedy_->place(first), PlacementOutcome::Placed);
    EXPECT_EQ(greedy_->place(second), PlacementOutcome::Failed);
    EXPECT_EQ(start_of(first), 540);
    EXPECT_EQ(context_->eviction_count(), 0U);
}

TEST_F(GreedyPlacerTest, EvictionPermissions) {
    auto dep = add("dep", 1, 30);
    auto task = add("task", 5, 30, {"dep"});
    auto other = add("other", 1, 30);
    auto pinned = add("pinned", 1, 30);
    tasks_[pinned].fixed = Interval{600, 630};
    build(nine_to_five());
    context_->commit(pinned, 60);

    EXPECT_FALSE(greedy_->can_evict(task, dep));
    EXPECT_TRUE(greedy_->can_evict(task, other));
    EXPECT_FALSE(greedy_->can_evict(task, pinned));
    EXPECT_FALSE(greedy_->can_evict(other, task));
    EXPECT_FALSE(greedy_->can_evict(task, task));
}

TEST_F(GreedyPlacerTest, EvictionCarriesDependents) {
    auto a = add("a", 1, 60);
    auto c = add("c", 1, 60, {"a"});
    auto high = add("high", 5, 60);
    tasks_[high].deadline = 600;
    build(nine_to_five());

    ASSERT_EQ(greedy_->place(a), PlacementOutcome::Placed);
    ASSERT_EQ(greedy_->place(c), PlacementOutcome::Placed);
    ASSERT_EQ(greedy_->place(high), PlacementOutcome::Placed);

    EXPECT_EQ(start_of(high), 540);
    EXPECT_EQ(context_->eviction_count(), 2U);
    EXPECT_EQ(start_of(a), 600);
    EXPECT_EQ(start_of(c), 660);
    EXPECT_TRUE(tasks_[a].rescheduled);
    EXPECT_TRUE(tasks_[c].rescheduled);
}

TEST_F(GreedyPlacerTest, UnplaceableVictimIsDisplaced) {
    auto low = add("low", 1, 480);
    tasks_[low].deadline = 17 * 60;
    auto high = add("high", 5, 60);
    tasks_[high].deadline = 600;
    build(nine_to_five());

    ASSERT_EQ(greedy_->place(low), PlacementOutcome::Placed);
    ASSERT_EQ(greedy_->place(high), PlacementOutcome::Placed);

    EXPECT_FALSE(tasks_[low].assigned);
    EXPECT_TRUE(context_->was_evicted(low));
    EXPECT_TRUE(context_->failure(low).has_value());

    auto displaced = greedy_->take_displaced();
    EXPECT_EQ(displaced, (std::vector<TaskIndex>{low}));
    EXPECT_TRUE(greedy_->take_displaced().empty());
}

TEST_F(GreedyPlacerTest, DroppedDisplacedListLeavesTaskPending) {
    auto low = add("low", 1, 480);
    tasks_[low].deadline = 17 * 60;
    auto high = add("high", 5, 60);
    tasks_[high].deadline = 600;
    build(nine_to_five());

    ASSERT_EQ(greedy_->place(low), PlacementOutcome::Placed);
    ASSERT_EQ(greedy_->place(high), PlacementOutcome::Placed);

    greedy_->drop_displaced();
    EXPECT_TRUE(greedy_->take_displaced().empty());
    // Still unplaced, so the next phase sees it
    EXPECT_FALSE(context_->is_completed(low));
    EXPECT_TRUE(context_->was_evicted(low));
}

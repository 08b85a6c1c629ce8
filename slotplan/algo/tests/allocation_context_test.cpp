#include <slotplan/algo/allocation_context.hpp>
#include <slotplan/algo/dependency_graph.hpp>

#include <slotplan/core/error.hpp>
#include <slotplan/core/slot_grid.hpp>
#include <slotplan/core/task.hpp>
#include <slotplan/core/trace_writer.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

using namespace slotplan::algo;
using namespace slotplan::core;

// Keeps (type, task) of every record
class TaskEventWriter : public TraceWriter {
public:
    void begin(Minute /*time*/) override { events.emplace_back(); }
    void type(std::string_view name) override { events.back().first = name; }
    void field(std::string_view /*key*/, double /*value*/) override {}
    void field(std::string_view /*key*/, std::int64_t /*value*/) override {}
    void field(std::string_view key, std::string_view value) override {
        if (key == "task") {
            events.back().second = value;
        }
    }
    void end() override {}

    std::vector<std::pair<std::string, std::string>> events;
};

class AllocationContextTest : public ::testing::Test {
protected:
    static GridConfig nine_to_five(Minutes rest = 0) {
        GridConfig config;
        config.working_start = 9 * 60;
        config.working_end = 17 * 60;
        config.break_interval = 0;
        config.break_duration = rest;
        return config;
    }

    TaskIndex add(std::string id, Minutes duration, std::vector<std::string> deps = {}) {
        Task t;
        t.id = std::move(id);
        t.priority = 1;
        t.duration = duration;
        t.dependencies = std::move(deps);
        tasks_.push_back(std::move(t));
        return tasks_.size() - 1;
    }

    AllocationContext& build(const GridConfig& config, TraceWriter* writer = nullptr) {
        graph_ = std::make_unique<DependencyGraph>(tasks_);
        context_ = std::make_unique<AllocationContext>(tasks_, *graph_, config, writer);
        return *context_;
    }

    static FeasibleWindow window_of(const AllocationContext& ctx, TaskIndex task) {
        auto range = ctx.feasible_window(task);
        EXPECT_TRUE(std::holds_alternative<FeasibleWindow>(range));
        return std::get<FeasibleWindow>(range);
    }

    static FailureReason reason_of(const AllocationContext& ctx, TaskIndex task) {
        auto range = ctx.feasible_window(task);
        EXPECT_TRUE(std::holds_alternative<FailureReason>(range));
        return std::get<FailureReason>(range);
    }

    std::vector<Task> tasks_;
    std::unique_ptr<DependencyGraph> graph_;
    std::unique_ptr<AllocationContext> context_;
};

// =============================================================================
// Feasible window
// =============================================================================

TEST_F(AllocationContextTest, UnconstrainedWindowSpansGrid) {
    auto a = add("a", 60);
    auto& ctx = build(nine_to_five());
    auto window = window_of(ctx, a);
    EXPECT_EQ(window.first, 0U);
    EXPECT_EQ(window.last, ctx.grid().size() - 60);
}

TEST_F(AllocationContextTest, ExtremeDeadlinesStayInRange) {
    auto early = add("early", 30);
    tasks_[early].deadline = std::numeric_limits<Minute>::min();
    auto open = add("open", 30);
    tasks_[open].deadline = std::numeric_limits<Minute>::max();
    auto& ctx = build(nine_to_five(15));

    EXPECT_EQ(reason_of(ctx, early), FailureReason::DeadlineUnreachable);
    EXPECT_EQ(window_of(ctx, open).last, ctx.grid().size() - 30);
}

TEST_F(AllocationContextTest, StartWindowNarrowsRange) {
    auto a = add("a", 60);
    tasks_[a].earliest_start = MINUTES_PER_DAY + 10 * 60;
    tasks_[a].latest_start = MINUTES_PER_DAY + 12 * 60;
    auto evening = add("evening", 60);
    tasks_[evening].earliest_start = 20 * 60;
    auto& ctx = build(nine_to_five());

    // Tuesday 10:00 and 12:00, one 480-slot day in
    auto window = window_of(ctx, a);
    EXPECT_EQ(window.first, 540U);
    EXPECT_EQ(window.last, 660U);
    // Monday evening is off the grid, so the window opens Tuesday 09:00
    EXPECT_EQ(window_of(ctx, evening).first, 480U);
}

TEST_F(AllocationContextTest, EmptyStartWindowHasNoRange) {
    auto inverted = add("inverted", 30);
    tasks_[inverted].earliest_start = 12 * 60;
    tasks_[inverted].latest_start = 11 * 60;
    auto dawn = add("dawn", 30);
    tasks_[dawn].latest_start = 6 * 60;
    auto& ctx = build(nine_to_five());

    EXPECT_EQ(reason_of(ctx, inverted), FailureReason::NoFreeWindow);
    EXPECT_EQ(reason_of(ctx, dawn), FailureReason::NoFreeWindow);
}

TEST_F(AllocationContextTest, DependencyFloorOverridesEarlierStart) {
    auto a = add("a", 60);
    auto b = add("b", 30, {"a"});
    tasks_[b].earliest_start = 9 * 60;
    auto& ctx = build(nine_to_five());
    ctx.commit(a, 100);
    EXPECT_EQ(window_of(ctx, b).first, 160U);
}

TEST_F(AllocationContextTest, DeadlineLeavesRoomForRest) {
    auto a = add("a", 60);
    tasks_[a].deadline = 11 * 60;
    auto& ctx = build(nine_to_five(15));
    // 11:00 - 60 - 15 = 09:45
    EXPECT_EQ(window_of(ctx, a).last, 45U);
}

TEST_F(AllocationContextTest, DeadlineBeforeFirstMinuteIsUnreachable) {
    auto a = add("a", 60);
    tasks_[a].deadline = 500;
    auto& ctx = build(nine_to_five());
    EXPECT_EQ(reason_of(ctx, a), FailureReason::DeadlineUnreachable);
}

TEST_F(AllocationContextTest, MissingEffortHasNoWindow) {
    auto a = add("a", 0);
    auto& ctx = build(nine_to_five());
    EXPECT_EQ(reason_of(ctx, a), FailureReason::MissingEffort);
}

TEST_F(AllocationContextTest, UnplacedDependencyHasNoWindow) {
    add("a", 60);
    auto b = add("b", 60, {"a"});
    auto& ctx = build(nine_to_five());
    EXPECT_FALSE(ctx.dependencies_completed(b));
    EXPECT_EQ(reason_of(ctx, b), FailureReason::DependencyUnplaced);
}

TEST_F(AllocationContextTest, DependencyEndIsTheFloor) {
    auto a = add("a", 60);
    auto b = add("b", 30, {"a"});
    auto& ctx = build(nine_to_five());
    ctx.commit(a, 100);
    EXPECT_TRUE(ctx.dependencies_completed(b));
    EXPECT_EQ(window_of(ctx, b).first, 160U);
}

TEST_F(AllocationContextTest, PlacedDependentIsTheCeiling) {
    auto a = add("a", 60);
    auto b = add("b", 30, {"a"});
    auto& ctx = build(nine_to_five());
    ctx.commit(b, 120);
    // b starts at 11:00, so a must start by 10:00
    EXPECT_EQ(window_of(ctx, a).last, 60U);
}

// =============================================================================
// Window check
// =============================================================================

TEST_F(AllocationContextTest, WindowMayNotCrossEndOfDay) {
    auto a = add("a", 60);
    auto& ctx = build(nine_to_five());
    EXPECT_TRUE(ctx.check_window(a, 420).free());
    EXPECT_TRUE(ctx.check_window(a, 421).blocked);
}

TEST_F(AllocationContextTest, ConflictsListEachOccupantOnce) {
    auto a = add("a", 30);
    auto b = add("b", 30);
    auto c = add("c", 90);
    auto& ctx = build(nine_to_five());
    ctx.commit(a, 0);
    ctx.commit(b, 30);

    auto check = ctx.check_window(c, 10);
    EXPECT_FALSE(check.blocked);
    EXPECT_EQ(check.conflicts, (std::vector<TaskIndex>{a, b}));
}

TEST_F(AllocationContextTest, RestBlocksFollowingWindow) {
    auto a = add("a", 60);
    auto b = add("b", 30);
    auto& ctx = build(nine_to_five(15));
    ctx.commit(a, 0);

    EXPECT_TRUE(ctx.grid().slot(60).is_break());
    EXPECT_EQ(ctx.grid().slot(74).rest_owner, a);
    EXPECT_FALSE(ctx.grid().slot(75).occupied());
    EXPECT_TRUE(ctx.check_window(b, 60).blocked);
    EXPECT_TRUE(ctx.check_window(b, 75).free());
}

TEST_F(AllocationContextTest, RestIsCutAtEndOfDay) {
    auto a = add("a", 60);
    auto& ctx = build(nine_to_five(15));
    ctx.commit(a, 420);
    EXPECT_EQ(ctx.grid().free_count(), ctx.grid().size() - 60);
    EXPECT_FALSE(ctx.grid().slot(480).occupied());
}

// =============================================================================
// Commit, unassign, evict
// =============================================================================

TEST_F(AllocationContextTest, CommitAnnotatesTask) {
    auto a = add("a", 45);
    auto& ctx = build(nine_to_five());
    ctx.commit(a, 480);

    ASSERT_TRUE(tasks_[a].assigned);
    EXPECT_EQ(*tasks_[a].assigned, (Interval{1440 + 540, 1440 + 585}));
    EXPECT_FALSE(tasks_[a].rescheduled);
    EXPECT_TRUE(ctx.is_completed(a));
    EXPECT_EQ(ctx.start_slot(a), 480U);
    ASSERT_EQ(ctx.placed().size(), 1U);
}

TEST_F(AllocationContextTest, CommitRejectsTakenWindow) {
    auto a = add("a", 60);
    auto b = add("b", 60);
    auto& ctx = build(nine_to_five());
    ctx.commit(a, 0);
    EXPECT_THROW(ctx.commit(a, 200), SchedulingError);
    EXPECT_THROW(ctx.commit(b, 30), SchedulingError);
}

TEST_F(AllocationContextTest, FixedTaskMovedAwayIsRescheduled) {
    auto a = add("a", 60);
    tasks_[a].fixed = Interval{600, 660};
    auto& ctx = build(nine_to_five());
    ctx.commit(a, 0);
    EXPECT_TRUE(tasks_[a].rescheduled);
}

TEST_F(AllocationContextTest, UnassignRestoresGrid) {
    auto a = add("a", 60);
    auto& ctx = build(nine_to_five(15));
    ctx.commit(a, 0);
    ctx.unassign(a);

    EXPECT_EQ(ctx.grid().free_count(), ctx.grid().size());
    EXPECT_FALSE(tasks_[a].assigned);
    EXPECT_FALSE(tasks_[a].rescheduled);
    EXPECT_FALSE(ctx.is_completed(a));
    EXPECT_TRUE(ctx.placed().empty());
    EXPECT_EQ(ctx.eviction_count(), 0U);
}

TEST_F(AllocationContextTest, EvictFollowsPlacedDependents) {
    auto a = add("a", 60);
    auto b = add("b", 60, {"a"});
    auto c = add("c", 60, {"b"});
    auto d = add("d", 60);
    auto& ctx = build(nine_to_five());
    ctx.commit(a, 0);
    ctx.commit(b, 60);
    ctx.commit(c, 120);
    ctx.commit(d, 180);

    std::vector<TaskIndex> victims{a};
    auto evicted = ctx.evict(victims);

    EXPECT_EQ(evicted.size(), 3U);
    EXPECT_EQ(ctx.eviction_count(), 3U);
    for (TaskIndex t : {a, b, c}) {
        EXPECT_FALSE(ctx.is_completed(t));
        EXPECT_TRUE(ctx.was_evicted(t));
        EXPECT_TRUE(tasks_[t].rescheduled);
    }
    EXPECT_TRUE(ctx.is_completed(d));
    EXPECT_FALSE(ctx.was_evicted(d));
    EXPECT_EQ(ctx.grid().free_count(), ctx.grid().size() - 60);
}

TEST_F(AllocationContextTest, EvictionTracesRescheduleOncePerTask) {
    auto a = add("a", 60);
    auto b = add("b", 60, {"a"});
    TaskEventWriter writer;
    auto& ctx = build(nine_to_five(), &writer);
    ctx.commit(a, 0);
    ctx.commit(b, 60);

    std::vector<TaskIndex> victims{a};
    (void)ctx.evict(victims);
    ctx.commit(a, 120);
    (void)ctx.evict(victims);

    using Event = std::pair<std::string, std::string>;
    std::vector<Event> rescheduled;
    for (const auto& event : writer.events) {
        if (event.first == "task_rescheduled") {
            rescheduled.push_back(event);
        }
    }
    EXPECT_EQ(rescheduled, (std::vector<Event>{{"task_rescheduled", "a"}, {"task_rescheduled", "b"}}));
    EXPECT_EQ(ctx.eviction_count(), 3U);
}

TEST_F(AllocationContextTest, FailureIsClearedOnCommit) {
    auto a = add("a", 60);
    auto& ctx = build(nine_to_five());
    ctx.record_failure(a, FailureReason::NoFreeWindow);
    EXPECT_EQ(ctx.failure(a), FailureReason::NoFreeWindow);
    ctx.commit(a, 0);
    EXPECT_FALSE(ctx.failure(a).has_value());
}

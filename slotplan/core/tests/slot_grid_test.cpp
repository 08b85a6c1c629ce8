#include <slotplan/core/slot_grid.hpp>
#include <slotplan/core/error.hpp>

#include <gtest/gtest.h>

using namespace slotplan::core;

class SlotGridTest : public ::testing::Test {
protected:
    static GridConfig nine_to_five() {
        GridConfig config;
        config.working_start = 9 * 60;
        config.working_end = 17 * 60;
        config.break_interval = 0;
        config.break_duration = 0;
        return config;
    }
};

// =============================================================================
// Configuration
// =============================================================================

TEST_F(SlotGridTest, DefaultConfigIsValid) {
    GridConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.working_start, 480);
    EXPECT_EQ(config.working_end, 1320);
    EXPECT_EQ(config.break_interval, 0);
    EXPECT_EQ(config.break_duration, 15);
}

TEST_F(SlotGridTest, RejectsEmptyWorkingHours) {
    GridConfig config;
    config.working_start = 600;
    config.working_end = 600;
    EXPECT_THROW(SlotGrid{config}, GridConfigurationError);
}

TEST_F(SlotGridTest, RejectsOutOfDayBounds) {
    GridConfig config;
    config.working_start = -1;
    EXPECT_THROW(config.validate(), GridConfigurationError);

    config.working_start = 0;
    config.working_end = 1441;
    EXPECT_THROW(config.validate(), GridConfigurationError);
}

TEST_F(SlotGridTest, RejectsNegativeBreakValues) {
    GridConfig config;
    config.break_duration = -1;
    EXPECT_THROW(config.validate(), GridConfigurationError);

    config.break_duration = 15;
    config.break_interval = -60;
    EXPECT_THROW(config.validate(), GridConfigurationError);
}

TEST_F(SlotGridTest, RejectsRestLongerThanWorkingDay) {
    GridConfig config;
    config.working_start = 9 * 60;
    config.working_end = 17 * 60;
    config.break_interval = 0;
    config.break_duration = 8 * 60;
    EXPECT_NO_THROW(config.validate());

    config.break_duration = 8 * 60 + 1;
    EXPECT_THROW(config.validate(), GridConfigurationError);
}

TEST_F(SlotGridTest, RejectsBreakFillingWholeCycle) {
    GridConfig config;
    config.break_interval = 30;
    config.break_duration = 30;
    EXPECT_THROW(config.validate(), GridConfigurationError);
}

// =============================================================================
// Generation and lookup
// =============================================================================

TEST_F(SlotGridTest, OneSlotPerWorkingMinute) {
    SlotGrid grid(nine_to_five());
    EXPECT_EQ(grid.size(), 8U * 60U * 7U);
    EXPECT_EQ(grid.free_count(), grid.size());
}

TEST_F(SlotGridTest, SlotsAreAtomicMinutes) {
    SlotGrid grid(nine_to_five());
    const auto& first = grid.slot(0);
    EXPECT_EQ(first.start, 540);
    EXPECT_EQ(first.end, 541);
    EXPECT_FALSE(first.occupied());

    // First slot of Tuesday follows the last slot of Monday
    const auto& tuesday = grid.slot(480);
    EXPECT_EQ(tuesday.start, 1440 + 540);
}

TEST_F(SlotGridTest, IndexOfMapsWorkingMinutesOnly) {
    SlotGrid grid(nine_to_five());
    EXPECT_EQ(grid.index_of(540), 0U);
    EXPECT_EQ(grid.index_of(599), 59U);
    EXPECT_FALSE(grid.index_of(539).has_value());
    EXPECT_FALSE(grid.index_of(17 * 60).has_value());
    EXPECT_FALSE(grid.index_of(-1).has_value());
    EXPECT_FALSE(grid.index_of(MINUTES_PER_WEEK).has_value());
}

TEST_F(SlotGridTest, NearestIndexLookups) {
    SlotGrid grid(nine_to_five());
    // Before Monday's working hours
    EXPECT_EQ(grid.first_index_at_or_after(0), 0U);
    EXPECT_FALSE(grid.last_index_at_or_before(539).has_value());
    // Monday night maps to Tuesday morning, or back to Monday's last slot
    EXPECT_EQ(grid.first_index_at_or_after(20 * 60), 480U);
    EXPECT_EQ(grid.last_index_at_or_before(20 * 60), 479U);
    // After the last working minute of the week
    EXPECT_FALSE(grid.first_index_at_or_after(MINUTES_PER_WEEK - 1).has_value());
}

TEST_F(SlotGridTest, ContiguityStopsAtEndOfDay) {
    SlotGrid grid(nine_to_five());
    EXPECT_TRUE(grid.is_contiguous(0, 480));
    EXPECT_FALSE(grid.is_contiguous(0, 481));
    EXPECT_TRUE(grid.is_contiguous(420, 60));
    EXPECT_FALSE(grid.is_contiguous(421, 60));
    EXPECT_EQ(grid.block_end(10), 480U);
    EXPECT_FALSE(grid.is_contiguous(grid.size() - 1, 2));
}

TEST_F(SlotGridTest, RoundTheClockGridIsOneBlock) {
    GridConfig config;
    config.working_start = 0;
    config.working_end = MINUTES_PER_DAY;
    SlotGrid grid(config);
    EXPECT_EQ(grid.size(), static_cast<std::size_t>(MINUTES_PER_WEEK));
    EXPECT_TRUE(grid.is_contiguous(1400, 100));
    EXPECT_EQ(grid.block_end(0), grid.size());
}

// =============================================================================
// Periodic breaks
// =============================================================================

TEST_F(SlotGridTest, PeriodicBreaksCloseEachCycle) {
    GridConfig config = nine_to_five();
    config.break_interval = 60;
    config.break_duration = 10;
    SlotGrid grid(config);

    // 09:00-09:49 free, 09:50-09:59 break, 10:00 free again
    EXPECT_FALSE(grid.slot(49).is_break());
    EXPECT_TRUE(grid.slot(50).is_break());
    EXPECT_TRUE(grid.slot(50).periodic_break);
    EXPECT_TRUE(grid.slot(59).is_break());
    EXPECT_FALSE(grid.slot(60).is_break());

    EXPECT_EQ(grid.free_count(), grid.size() - 8U * 10U * 7U);
}

TEST_F(SlotGridTest, BreakCyclesRestartEachDay) {
    GridConfig config = nine_to_five();
    config.break_interval = 60;
    config.break_duration = 10;
    SlotGrid grid(config);

    auto tuesday = *grid.index_of(1440 + 540);
    EXPECT_FALSE(grid.slot(tuesday).is_break());
    EXPECT_TRUE(grid.slot(tuesday + 50).is_break());
}

// =============================================================================
// Occupancy
// =============================================================================

TEST_F(SlotGridTest, AssignAndRelease) {
    SlotGrid grid(nine_to_five());
    grid.assign(0, 7);
    grid.assign(1, 7);
    grid.reserve_rest(2, 7);

    EXPECT_EQ(grid.slot(0).state, SlotState::Task);
    EXPECT_EQ(grid.slot(0).occupant, 7U);
    EXPECT_TRUE(grid.slot(2).is_break());
    EXPECT_EQ(grid.slot(2).rest_owner, 7U);
    EXPECT_FALSE(grid.slot(2).occupant.has_value());
    EXPECT_EQ(grid.free_count(), grid.size() - 3);

    grid.release(0, 3, 7);
    EXPECT_EQ(grid.free_count(), grid.size());
    EXPECT_FALSE(grid.slot(0).occupant.has_value());
    EXPECT_FALSE(grid.slot(2).rest_owner.has_value());
}

TEST_F(SlotGridTest, SlotNeverHoldsTwoTasks) {
    SlotGrid grid(nine_to_five());
    grid.assign(5, 1);
    EXPECT_THROW(grid.assign(5, 2), SchedulingError);
    EXPECT_THROW(grid.reserve_rest(5, 2), SchedulingError);
}

TEST_F(SlotGridTest, ReleaseOnlyTouchesOwnSlots) {
    SlotGrid grid(nine_to_five());
    grid.assign(0, 1);
    grid.reserve_rest(1, 1);
    grid.assign(2, 2);

    grid.release(0, 3, 2);
    EXPECT_EQ(grid.slot(0).occupant, 1U);
    EXPECT_EQ(grid.slot(1).rest_owner, 1U);
    EXPECT_FALSE(grid.slot(2).occupied());
}

TEST_F(SlotGridTest, RestMaySharePeriodicBreak) {
    GridConfig config = nine_to_five();
    config.break_interval = 60;
    config.break_duration = 10;
    SlotGrid grid(config);

    EXPECT_NO_THROW(grid.reserve_rest(50, 3));
    EXPECT_TRUE(grid.slot(50).periodic_break);
    EXPECT_FALSE(grid.slot(50).rest_owner.has_value());

    // Releasing a task never frees a periodic break
    grid.release(0, grid.size(), 3);
    EXPECT_TRUE(grid.slot(50).is_break());
}

TEST_F(SlotGridTest, PeriodicBreakCannotHoldTask) {
    GridConfig config = nine_to_five();
    config.break_interval = 60;
    config.break_duration = 10;
    SlotGrid grid(config);
    EXPECT_THROW(grid.assign(55, 0), SchedulingError);
}

TEST_F(SlotGridTest, SlotAccessOutOfRangeThrows) {
    SlotGrid grid(nine_to_five());
    EXPECT_THROW((void)grid.slot(grid.size()), std::out_of_range);
}

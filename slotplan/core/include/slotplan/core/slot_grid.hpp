#pragma once

#include <slotplan/core/types.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace slotplan::core {

/// @brief Parameters of the weekly grid.
///
/// All values are minutes. Working hours are minutes from midnight and
/// apply identically to all seven days.
///
/// @ingroup core_grid
/// @see SlotGrid
struct GridConfig {
    Minutes working_start{8 * MINUTES_PER_HOUR};  ///< First working minute of each day.
    Minutes working_end{22 * MINUTES_PER_HOUR};   ///< One past the last working minute.
    Minutes break_interval{0};   ///< Length of a periodic work/break cycle; 0 disables periodic breaks.
    Minutes break_duration{15};  ///< Rest after every placed task, and length of each periodic break.

    /// @brief Check that the configuration yields a non-empty grid.
    /// @throws GridConfigurationError  On any invalid bound.
    void validate() const;
};

/// @brief Occupancy of a single slot.
/// @ingroup core_grid
enum class SlotState {
    Free,   ///< Available for a task.
    Task,   ///< Holds a task minute.
    Break   ///< Rest period; never holds a task.
};

/// @brief One atomic minute of the weekly grid.
///
/// A slot in the Task state names its occupant. A slot in the Break state
/// has no occupant; if the break is the rest that follows a task,
/// @c rest_owner names that task so the rest can be released with it.
/// Periodic breaks have no owner and are never released.
///
/// @ingroup core_grid
struct TimeSlot {
    SlotIndex index{0};
    Minute start{0};
    Minute end{0};
    SlotState state{SlotState::Free};
    std::optional<TaskIndex> occupant;
    std::optional<TaskIndex> rest_owner;
    bool periodic_break{false};

    [[nodiscard]] bool occupied() const noexcept { return state != SlotState::Free; }
    [[nodiscard]] bool is_break() const noexcept { return state == SlotState::Break; }
};

/// @brief The universe of schedulable minutes for one abstract week.
///
/// Built once per allocation run from a GridConfig. The sequence of slots
/// and the minute-to-index table never change afterwards; only slot
/// contents are mutated through assign(), reserve_rest() and release().
///
/// Slot indices are dense and ordered by start minute, but consecutive
/// indices are only consecutive minutes inside one continuous working
/// block. Callers that need a contiguous run must check is_contiguous().
///
/// Non-copyable, movable.
///
/// @ingroup core_grid
class SlotGrid {
public:
    /// @brief Generate the grid.
    /// @param config  Working hours and break parameters.
    /// @throws GridConfigurationError  If @p config is invalid.
    explicit SlotGrid(const GridConfig& config);

    SlotGrid(const SlotGrid&) = delete;
    SlotGrid& operator=(const SlotGrid&) = delete;
    SlotGrid(SlotGrid&&) = default;
    SlotGrid& operator=(SlotGrid&&) = default;

    [[nodiscard]] const GridConfig& config() const noexcept { return config_; }
    [[nodiscard]] std::size_t size() const noexcept { return slots_.size(); }
    [[nodiscard]] std::span<const TimeSlot> slots() const noexcept { return slots_; }

    /// @brief Access a slot by index.
    /// @throws std::out_of_range  If @p index >= size().
    [[nodiscard]] const TimeSlot& slot(SlotIndex index) const { return slots_.at(index); }

    /// @brief Exact lookup of a minute in the grid.
    /// @return Index of the slot starting at @p minute, or std::nullopt if the
    ///         minute is outside working hours or outside the week.
    [[nodiscard]] std::optional<SlotIndex> index_of(Minute minute) const noexcept;

    /// @brief First slot whose start is >= @p minute.
    [[nodiscard]] std::optional<SlotIndex> first_index_at_or_after(Minute minute) const noexcept;

    /// @brief Last slot whose start is <= @p minute.
    [[nodiscard]] std::optional<SlotIndex> last_index_at_or_before(Minute minute) const noexcept;

    /// @brief True if @p count slots starting at @p first are consecutive minutes.
    [[nodiscard]] bool is_contiguous(SlotIndex first, std::size_t count) const noexcept;

    /// @brief One past the last index of the continuous working block containing @p index.
    [[nodiscard]] SlotIndex block_end(SlotIndex index) const { return block_end_.at(index); }

    /// @brief Number of slots currently in the Free state.
    [[nodiscard]] std::size_t free_count() const noexcept;

    /// @brief Put a task minute into a free slot.
    /// @throws SchedulingError  If the slot is not free.
    void assign(SlotIndex index, TaskIndex task);

    /// @brief Mark a slot as the rest following @p owner.
    ///
    /// A periodic break slot may be shared as rest; it keeps its periodic
    /// flag and no owner is recorded on it.
    ///
    /// @throws SchedulingError  If the slot holds a task or another task's rest.
    void reserve_rest(SlotIndex index, TaskIndex owner);

    /// @brief Free every slot held by @p task, as occupant or rest owner.
    ///
    /// Only slots in `[first, last)` are inspected.
    void release(SlotIndex first, SlotIndex last, TaskIndex task);

private:
    GridConfig config_;
    std::vector<TimeSlot> slots_;
    std::vector<SlotIndex> minute_to_index_;
    std::vector<SlotIndex> block_end_;
};

} // namespace slotplan::core

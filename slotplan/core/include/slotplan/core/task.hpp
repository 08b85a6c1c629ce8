#pragma once

#include <slotplan/core/types.hpp>

#include <optional>
#include <string>
#include <vector>

namespace slotplan::core {

/// @brief A unit of schedulable work.
/// @ingroup core
///
/// Tasks are created by the caller, handed to the allocator by reference and
/// returned annotated. Only two components mutate them during a run: the
/// priority propagator raises @c priority, the allocator writes
/// @c assigned and @c rescheduled.
///
/// Nullable inputs are modelled as optionals. A task is *fixed* when
/// @c fixed is set, and *flexible* otherwise. The schedulable length comes
/// from the fixed window, then @c duration, then @c estimate (see effort()).
///
/// @c earliest_start and @c latest_start narrow where a flexible placement
/// may begin. They do not apply to the fixed window itself, only to a fixed
/// task that was evicted and is placed again.
///
/// @see SlotGrid, algo::SlotAllocator
struct Task {
    std::string id;                         ///< Unique identifier.
    int priority{0};                        ///< Higher runs first; may be boosted.
    std::vector<std::string> dependencies;  ///< Ids that must finish before this task starts.
    std::optional<Minutes> duration;        ///< Exact length in minutes.
    std::optional<Minutes> estimate;        ///< Estimated effort, used when duration is absent.
    std::optional<Minute> deadline;         ///< Latest allowed end, minute-of-week.
    std::optional<Interval> fixed;          ///< Caller-imposed window.
    std::optional<Minute> earliest_start;   ///< Flexible placements start no earlier.
    std::optional<Minute> latest_start;     ///< Flexible placements start no later.

    std::optional<Interval> assigned;       ///< Output: where the allocator put the task.
    bool rescheduled{false};                ///< Output: moved from its fixed or first placement.

    /// @brief Number of minutes the task needs on the grid.
    ///
    /// Fixed tasks need exactly the length of their window. Flexible tasks
    /// use @c duration when present, else @c estimate. Non-positive values
    /// count as missing.
    ///
    /// @return Required length, or std::nullopt when the task is unschedulable.
    [[nodiscard]] std::optional<Minutes> effort() const noexcept;

    /// @brief True when the caller pinned the task to an explicit window.
    [[nodiscard]] bool is_fixed() const noexcept { return fixed.has_value(); }

    /// @brief True once the allocator has assigned a window.
    [[nodiscard]] bool is_placed() const noexcept { return assigned.has_value(); }

    /// @brief True if the task currently sits exactly at its fixed window.
    [[nodiscard]] bool at_fixed_window() const noexcept {
        return fixed && assigned && *fixed == *assigned;
    }
};

} // namespace slotplan::core

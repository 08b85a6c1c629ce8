#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace slotplan::core {

/// @brief Absolute position in the recurring week, in minutes.
///
/// Monday 00:00 is minute 0 and Sunday 23:59 is minute 10079. This is the
/// only time unit understood by the allocator; conversion from calendar
/// timestamps is the caller's business.
///
/// @ingroup core_types
using Minute = std::int32_t;

/// @brief Length of time in minutes.
/// @ingroup core_types
using Minutes = std::int32_t;

/// @brief Stable handle of a task: its position in the input collection.
/// @ingroup core_types
using TaskIndex = std::size_t;

/// @brief Stable handle of a slot: its position in the weekly grid.
/// @ingroup core_types
using SlotIndex = std::size_t;

inline constexpr Minutes MINUTES_PER_HOUR = 60;
inline constexpr Minutes MINUTES_PER_DAY = 24 * MINUTES_PER_HOUR;
inline constexpr int DAYS_PER_WEEK = 7;
inline constexpr Minutes MINUTES_PER_WEEK = DAYS_PER_WEEK * MINUTES_PER_DAY;

/// @brief Sentinel used by the search code for "no slot".
inline constexpr SlotIndex NO_SLOT = std::numeric_limits<SlotIndex>::max();

/// @brief Build a minute-of-week from day (Monday = 0), hour and minute.
/// @param day     Day of the week in [0, 6].
/// @param hour    Hour of the day in [0, 23].
/// @param minute  Minute of the hour in [0, 59].
/// @return Minute-of-week value.
/// @ingroup core_types
[[nodiscard]] constexpr Minute minute_of_week(int day, int hour, int minute) noexcept {
    return day * MINUTES_PER_DAY + hour * MINUTES_PER_HOUR + minute;
}

/// @brief Day of the week (Monday = 0) that contains @p m.
/// @ingroup core_types
[[nodiscard]] constexpr int day_of(Minute m) noexcept {
    return m / MINUTES_PER_DAY;
}

/// @brief Offset of @p m from midnight of its day.
/// @ingroup core_types
[[nodiscard]] constexpr Minutes minute_of_day(Minute m) noexcept {
    return m % MINUTES_PER_DAY;
}

/// @brief Half-open interval of minutes `[start, end)`.
///
/// Used both for caller-supplied fixed windows and for the start/end
/// assigned by the allocator.
///
/// @ingroup core_types
struct Interval {
    Minute start{0};  ///< First minute covered.
    Minute end{0};    ///< One past the last minute covered.

    /// @brief Number of minutes covered (may be negative for malformed input).
    [[nodiscard]] constexpr Minutes length() const noexcept { return end - start; }

    /// @brief True if @p m lies inside the interval.
    [[nodiscard]] constexpr bool contains(Minute m) const noexcept {
        return m >= start && m < end;
    }

    /// @brief True if the two intervals share at least one minute.
    [[nodiscard]] constexpr bool overlaps(const Interval& other) const noexcept {
        return start < other.end && other.start < end;
    }

    constexpr auto operator<=>(const Interval&) const noexcept = default;
    constexpr bool operator==(const Interval&) const noexcept = default;
};

} // namespace slotplan::core

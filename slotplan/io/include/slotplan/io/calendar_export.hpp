#pragma once

/// @file calendar_export.hpp
/// @brief iCalendar (RFC 5545) export of placed tasks.
/// @ingroup io_writers

#include <slotplan/core/task.hpp>

#include <chrono>
#include <filesystem>
#include <ostream>
#include <span>

namespace slotplan::io {

/// @brief Write placed tasks as a VCALENDAR with one VEVENT per task.
///
/// Minute-of-week values are anchored on @p week_start, which must be a
/// Monday. Times are written as floating local times (no time zone), which
/// is what a recurring abstract week maps to.
///
/// Each event carries:
///  - UID `<id>@slotplan`, SUMMARY set to the task id,
///  - DTSTART/DTEND from the assigned window,
///  - PRIORITY mapped onto the 1 (highest) to 9 (lowest) iCalendar scale,
///  - a DESCRIPTION listing priority, dependencies, deadline and estimate.
///
/// Unplaced tasks are skipped.
///
/// @throws LoaderError  If @p week_start is not a valid Monday.
void export_ics(std::span<const core::Task> tasks, std::chrono::year_month_day week_start, std::ostream& out);

/// @brief Write the calendar to a file.
/// @throws LoaderError  If the file cannot be opened or @p week_start is invalid.
void export_ics(std::span<const core::Task> tasks, std::chrono::year_month_day week_start,
                const std::filesystem::path& path);

} // namespace slotplan::io

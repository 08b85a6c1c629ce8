#pragma once

/// @file report_writer.hpp
/// @brief JSON serialisation of allocation results.
/// @ingroup io_writers

#include <slotplan/algo/slot_allocator.hpp>

#include <slotplan/core/task.hpp>

#include <filesystem>
#include <ostream>
#include <span>

namespace slotplan::io {

/// @brief Write an allocation report as JSON.
///
/// Layout:
/// @code{.json}
/// {
///   "summary":  {"tasks": 3, "placed": 2, "unplaced": 1, "rescheduled": 0,
///                "evictions": 0, "search_nodes": 1, "search_bounded": false},
///   "placed":   [{"id": "A", "priority": 5, "start": 480, "end": 540,
///                 "deadline": null, "rescheduled": false, "dependencies": []}],
///   "unplaced": [{"id": "C", "reason": "no_free_window"}]
/// }
/// @endcode
///
/// Placed tasks are listed in placement order.
///
/// @param report  Result of SlotAllocator::allocate().
/// @param tasks   The task set the report refers to.
/// @param out     Output stream.
void write_report(const algo::AllocationReport& report, std::span<const core::Task> tasks, std::ostream& out);

/// @brief Write an allocation report to a file.
/// @throws LoaderError  If the file cannot be opened.
void write_report(const algo::AllocationReport& report, std::span<const core::Task> tasks,
                  const std::filesystem::path& path);

} // namespace slotplan::io

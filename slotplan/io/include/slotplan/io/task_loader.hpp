#pragma once

/// @file task_loader.hpp
/// @brief Loading of JSON task-set documents.
/// @ingroup io_loaders

#include <slotplan/algo/slot_allocator.hpp>

#include <slotplan/core/slot_grid.hpp>
#include <slotplan/core/task.hpp>

#include <filesystem>
#include <string_view>
#include <vector>

namespace slotplan::io {

/// @brief Everything an allocation run needs: grid, options and tasks.
///
/// The JSON document has three top-level members, all optional except
/// @c tasks:
///
/// @code{.json}
/// {
///   "grid":    {"working_start": 480, "working_end": 1320,
///               "break_interval": 0, "break_duration": 15},
///   "options": {"refine_lateness": false, "backtracking": true,
///               "search_node_limit": 200000},
///   "tasks":   [{"id": "A", "priority": 5, "dependencies": [],
///                "duration": 60, "estimate": null, "deadline": 2000,
///                "fixed_start": null, "fixed_end": null}]
/// }
/// @endcode
///
/// Task fields other than @c id may be omitted or set to @c null.
///
/// @ingroup io_loaders
/// @see load_task_set
struct TaskSetData {
    core::GridConfig grid;            ///< Working hours and break rules.
    algo::AllocatorOptions options;   ///< Strategy switches.
    std::vector<core::Task> tasks;    ///< Tasks in document order.
};

/// @brief Load a task set from a JSON file.
/// @param path  Filesystem path to the JSON document.
/// @return Parsed task set.
/// @throws LoaderError  If the file cannot be read or contains invalid data.
/// @see load_task_set_from_string
TaskSetData load_task_set(const std::filesystem::path& path);

/// @brief Load a task set from a JSON string.
/// @param json  JSON content.
/// @return Parsed task set.
/// @throws LoaderError  If the JSON is malformed or fails validation.
TaskSetData load_task_set_from_string(std::string_view json);

} // namespace slotplan::io

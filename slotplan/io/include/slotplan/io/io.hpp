#pragma once

/// @defgroup io I/O Library
/// @brief JSON task-set loading, reports, trace output and calendar export.
///
/// The I/O library handles all external data formats: loading task-set
/// JSON documents, writing allocation reports, writing allocation traces
/// (JSON, textual, in-memory) and exporting placed tasks to iCalendar.
/// Depends on core and algo.

/// @defgroup io_loaders Loaders
/// @ingroup io
/// @brief Task-set JSON loader.

/// @defgroup io_writers Writers
/// @ingroup io
/// @brief Report, trace and calendar writers.

// Convenience header for the I/O library

#include <slotplan/io/error.hpp>
#include <slotplan/io/trace_writers.hpp>
#include <slotplan/io/task_loader.hpp>
#include <slotplan/io/report_writer.hpp>
#include <slotplan/io/calendar_export.hpp>

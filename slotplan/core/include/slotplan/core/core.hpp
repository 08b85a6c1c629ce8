#pragma once

/// @defgroup core Core Library
/// @brief Minute-of-week types, task records, the weekly slot grid and errors.
///
/// The core library holds the data every other part of slotplan works on:
/// the Task record, the SlotGrid built from working hours and break rules,
/// the structural error hierarchy and the TraceWriter interface. It has no
/// dependency on allocation strategies or on I/O.

/// @defgroup core_types Types
/// @ingroup core
/// @brief Minute-of-week values and intervals.

/// @defgroup core_grid Slot Grid
/// @ingroup core
/// @brief Weekly grid of atomic one-minute slots.

// Convenience header for the core library
#include <slotplan/core/types.hpp>
#include <slotplan/core/error.hpp>
#include <slotplan/core/task.hpp>
#include <slotplan/core/slot_grid.hpp>
#include <slotplan/core/trace_writer.hpp>

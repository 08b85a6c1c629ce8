#pragma once

/// @defgroup algo Algo Library
/// @brief Priority propagation, task ordering and slot allocation strategies.
///
/// The algo library turns a task set into a placement on the weekly grid.
/// It propagates priorities along dependencies, orders the work queue and
/// runs the allocation phases (fixed insertion with eviction, greedy
/// placement, optional lateness refinement, backtracking search) over a
/// per-run AllocationContext. Depends on core only.

/// @defgroup algo_ordering Ordering
/// @ingroup algo
/// @brief Dependency graph, priority propagation and the task queue.

/// @defgroup algo_allocation Allocation
/// @ingroup algo
/// @brief Allocation context, placement strategies and the SlotAllocator facade.

// Convenience header for the algo library

#include <slotplan/algo/allocation_context.hpp>
#include <slotplan/algo/backtracking_search.hpp>
#include <slotplan/algo/dependency_graph.hpp>
#include <slotplan/algo/fixed_inserter.hpp>
#include <slotplan/algo/greedy_placer.hpp>
#include <slotplan/algo/lateness_refiner.hpp>
#include <slotplan/algo/priority_propagator.hpp>
#include <slotplan/algo/slot_allocator.hpp>
#include <slotplan/algo/task_queue.hpp>

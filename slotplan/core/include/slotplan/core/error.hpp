#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace slotplan::core {

/// @brief Base exception for all allocation errors.
///
/// Only structural problems are raised as exceptions: they abort the whole
/// allocation run. Problems that concern a single task are reported in the
/// allocation report instead (see FailureReason).
///
/// @see DependencyCycleError, GridConfigurationError, UnknownTaskError
/// @ingroup core
class SchedulingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// @brief Thrown when the dependency graph contains a cycle.
///
/// The offending cycle is kept so callers can print which tasks are
/// involved. The first and last entries of cycle() are the same task.
///
/// @ingroup core
class DependencyCycleError : public SchedulingError {
public:
    explicit DependencyCycleError(std::vector<std::string> cycle)
        : SchedulingError("dependency cycle: " + join(cycle))
        , cycle_(std::move(cycle)) {}

    /// @brief Task identifiers along the cycle, closed on the first one.
    [[nodiscard]] const std::vector<std::string>& cycle() const noexcept { return cycle_; }

private:
    static std::string join(const std::vector<std::string>& ids) {
        std::string out;
        for (const auto& id : ids) {
            if (!out.empty()) {
                out += " -> ";
            }
            out += id;
        }
        return out;
    }

    std::vector<std::string> cycle_;
};

/// @brief Thrown when working hours or break parameters yield an empty or
/// invalid weekly grid.
/// @ingroup core
class GridConfigurationError : public SchedulingError {
public:
    using SchedulingError::SchedulingError;
};

/// @brief Thrown when a task identifier is looked up but does not exist,
/// or when the same identifier is used twice.
/// @ingroup core
class UnknownTaskError : public SchedulingError {
public:
    using SchedulingError::SchedulingError;
};

/// @brief Why a task ended the run without a placement.
///
/// Every task that is not placed carries exactly one reason in the
/// allocation report.
///
/// @ingroup core
enum class FailureReason {
    MissingEffort,        ///< Neither duration nor estimate is usable.
    UnknownDependency,    ///< A dependency identifier is not in the task set.
    OutsideWorkingHours,  ///< Fixed window lies entirely outside the grid.
    DeadlineUnreachable,  ///< No grid minute can meet the deadline.
    NoFreeWindow,         ///< Feasible range exists but is fully taken.
    DependencyUnplaced,   ///< A dependency could not be placed before it.
    EvictionDeadlock,     ///< Evicted and never re-placed; the hole stays free.
    SearchExhausted       ///< Backtracking gave up on this task.
};

/// @brief Stable lowercase name of a failure reason (used in reports).
/// @ingroup core
[[nodiscard]] std::string_view to_string(FailureReason reason) noexcept;

} // namespace slotplan::core

#include <slotplan/core/error.hpp>

namespace slotplan::core {

std::string_view to_string(FailureReason reason) noexcept {
    switch (reason) {
        case FailureReason::MissingEffort:       return "missing_effort";
        case FailureReason::UnknownDependency:   return "unknown_dependency";
        case FailureReason::OutsideWorkingHours: return "outside_working_hours";
        case FailureReason::DeadlineUnreachable: return "deadline_unreachable";
        case FailureReason::NoFreeWindow:        return "no_free_window";
        case FailureReason::DependencyUnplaced:  return "dependency_unplaced";
        case FailureReason::EvictionDeadlock:    return "eviction_deadlock";
        case FailureReason::SearchExhausted:     return "search_exhausted";
    }
    return "unknown";
}

} // namespace slotplan::core

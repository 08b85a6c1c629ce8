#include <slotplan/core/task.hpp>

namespace slotplan::core {

std::optional<Minutes> Task::effort() const noexcept {
    if (fixed) {
        if (fixed->length() > 0) {
            return fixed->length();
        }
        return std::nullopt;
    }
    if (duration) {
        // An explicit but unusable duration does not fall back to the estimate
        if (*duration > 0) {
            return duration;
        }
        return std::nullopt;
    }
    if (estimate && *estimate > 0) {
        return estimate;
    }
    return std::nullopt;
}

} // namespace slotplan::core

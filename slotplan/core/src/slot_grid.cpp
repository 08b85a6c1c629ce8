#include <slotplan/core/slot_grid.hpp>
#include <slotplan/core/error.hpp>

#include <algorithm>
#include <string>

namespace slotplan::core {

void GridConfig::validate() const {
    if (working_start < 0 || working_start >= MINUTES_PER_DAY) {
        throw GridConfigurationError("working_start must be in [0, 1440), got " +
                                     std::to_string(working_start));
    }
    if (working_end <= working_start || working_end > MINUTES_PER_DAY) {
        throw GridConfigurationError("working_end must be in (working_start, 1440], got " +
                                     std::to_string(working_end));
    }
    if (break_duration < 0) {
        throw GridConfigurationError("break_duration must be non-negative");
    }
    if (break_duration > working_end - working_start) {
        throw GridConfigurationError("break_duration must not exceed the working day of " +
                                     std::to_string(working_end - working_start) + " minutes, got " +
                                     std::to_string(break_duration));
    }
    if (break_interval < 0) {
        throw GridConfigurationError("break_interval must be non-negative");
    }
    if (break_interval > 0 && break_duration >= break_interval) {
        // Every minute of every cycle would be a break
        throw GridConfigurationError("break_duration must be shorter than break_interval");
    }
}

SlotGrid::SlotGrid(const GridConfig& config)
    : config_(config)
    , minute_to_index_(static_cast<std::size_t>(MINUTES_PER_WEEK), NO_SLOT) {
    config_.validate();

    const auto per_day = static_cast<std::size_t>(config_.working_end - config_.working_start);
    slots_.reserve(per_day * DAYS_PER_WEEK);

    Minute block_start = 0;
    for (int day = 0; day < DAYS_PER_WEEK; ++day) {
        for (Minutes offset = config_.working_start; offset < config_.working_end; ++offset) {
            Minute minute = day * MINUTES_PER_DAY + offset;

            // A new block starts whenever the previous slot is not the previous minute
            if (slots_.empty() || slots_.back().end != minute) {
                block_start = minute;
            }

            TimeSlot slot;
            slot.index = slots_.size();
            slot.start = minute;
            slot.end = minute + 1;

            if (config_.break_interval > 0 && config_.break_duration > 0) {
                Minutes cycle_offset = (minute - block_start) % config_.break_interval;
                if (cycle_offset >= config_.break_interval - config_.break_duration) {
                    slot.state = SlotState::Break;
                    slot.periodic_break = true;
                }
            }

            minute_to_index_[static_cast<std::size_t>(minute)] = slot.index;
            slots_.push_back(slot);
        }
    }

    block_end_.assign(slots_.size(), slots_.size());
    for (std::size_t i = slots_.size(); i-- > 0;) {
        if (i + 1 < slots_.size() && slots_[i + 1].start == slots_[i].end) {
            block_end_[i] = block_end_[i + 1];
        } else {
            block_end_[i] = i + 1;
        }
    }
}

std::optional<SlotIndex> SlotGrid::index_of(Minute minute) const noexcept {
    if (minute < 0 || minute >= MINUTES_PER_WEEK) {
        return std::nullopt;
    }
    SlotIndex idx = minute_to_index_[static_cast<std::size_t>(minute)];
    if (idx == NO_SLOT) {
        return std::nullopt;
    }
    return idx;
}

std::optional<SlotIndex> SlotGrid::first_index_at_or_after(Minute minute) const noexcept {
    auto it = std::lower_bound(slots_.begin(), slots_.end(), minute,
        [](const TimeSlot& slot, Minute m) { return slot.start < m; });
    if (it == slots_.end()) {
        return std::nullopt;
    }
    return static_cast<SlotIndex>(it - slots_.begin());
}

std::optional<SlotIndex> SlotGrid::last_index_at_or_before(Minute minute) const noexcept {
    auto it = std::upper_bound(slots_.begin(), slots_.end(), minute,
        [](Minute m, const TimeSlot& slot) { return m < slot.start; });
    if (it == slots_.begin()) {
        return std::nullopt;
    }
    return static_cast<SlotIndex>((it - slots_.begin()) - 1);
}

bool SlotGrid::is_contiguous(SlotIndex first, std::size_t count) const noexcept {
    if (count == 0) {
        return first <= slots_.size();
    }
    if (first >= slots_.size() || count > slots_.size() - first) {
        return false;
    }
    return block_end_[first] >= first + count;
}

std::size_t SlotGrid::free_count() const noexcept {
    return static_cast<std::size_t>(std::count_if(slots_.begin(), slots_.end(),
        [](const TimeSlot& slot) { return slot.state == SlotState::Free; }));
}

void SlotGrid::assign(SlotIndex index, TaskIndex task) {
    auto& slot = slots_.at(index);
    if (slot.state != SlotState::Free) {
        throw SchedulingError("slot " + std::to_string(index) + " is not free");
    }
    slot.state = SlotState::Task;
    slot.occupant = task;
}

void SlotGrid::reserve_rest(SlotIndex index, TaskIndex owner) {
    auto& slot = slots_.at(index);
    if (slot.periodic_break) {
        return;
    }
    if (slot.state != SlotState::Free) {
        throw SchedulingError("slot " + std::to_string(index) + " cannot hold a rest period");
    }
    slot.state = SlotState::Break;
    slot.rest_owner = owner;
}

void SlotGrid::release(SlotIndex first, SlotIndex last, TaskIndex task) {
    last = std::min(last, static_cast<SlotIndex>(slots_.size()));
    for (SlotIndex i = first; i < last; ++i) {
        auto& slot = slots_[i];
        if ((slot.state == SlotState::Task && slot.occupant == task) ||
            (slot.state == SlotState::Break && slot.rest_owner == task)) {
            slot.state = SlotState::Free;
            slot.occupant.reset();
            slot.rest_owner.reset();
        }
    }
}

} // namespace slotplan::core

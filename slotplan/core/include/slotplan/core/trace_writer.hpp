#pragma once

#include <slotplan/core/types.hpp>

#include <cstdint>
#include <string_view>

namespace slotplan::core {

/// @brief Sink for the allocator's decision records.
/// @ingroup core
///
/// A record is a minute-of-week stamp, an event name and a flat list of
/// fields, delivered as `begin(time) type(name) field(...)* end()`.
/// Writers for JSON, text and memory live in slotplan-io.
///
/// @see algo::AllocationContext::trace()
class TraceWriter {
public:
    virtual ~TraceWriter() = default;

    /// @brief Begin a new record.
    /// @param time Minute-of-week the event refers to (0 for run-level events).
    virtual void begin(Minute time) = 0;

    /// @brief Set the event name (e.g. `"task_placed"`, `"task_evicted"`).
    virtual void type(std::string_view name) = 0;

    virtual void field(std::string_view key, double value) = 0;
    virtual void field(std::string_view key, std::int64_t value) = 0;
    virtual void field(std::string_view key, std::string_view value) = 0;

    /// @brief Close the current record.
    virtual void end() = 0;

protected:
    TraceWriter() = default;
    TraceWriter(const TraceWriter&) = default;
    TraceWriter& operator=(const TraceWriter&) = default;
    TraceWriter(TraceWriter&&) = default;
    TraceWriter& operator=(TraceWriter&&) = default;
};

} // namespace slotplan::core

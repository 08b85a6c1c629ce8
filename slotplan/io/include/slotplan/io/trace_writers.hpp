#pragma once

/// @file trace_writers.hpp
/// @brief Sinks for the allocator's decision trace.
/// @ingroup io_writers

#include <slotplan/core/trace_writer.hpp>
#include <slotplan/core/types.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace slotplan::io {

/// @brief Discards every record.
/// @ingroup io_writers
class NullTraceWriter : public core::TraceWriter {
public:
    void begin(core::Minute time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, std::int64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;
};

/// @brief Writes the trace as one JSON array of record objects.
/// @ingroup io_writers
///
/// Each record becomes `{"minute": m, "type": "...", <fields>}`. The array
/// is closed by close() or, failing that, by the destructor. The stream
/// must outlive the writer.
class JsonTraceWriter : public core::TraceWriter {
public:
    explicit JsonTraceWriter(std::ostream& output);
    ~JsonTraceWriter() override;

    JsonTraceWriter(const JsonTraceWriter&) = delete;
    JsonTraceWriter& operator=(const JsonTraceWriter&) = delete;
    JsonTraceWriter(JsonTraceWriter&&) = delete;
    JsonTraceWriter& operator=(JsonTraceWriter&&) = delete;

    void begin(core::Minute time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, std::int64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    /// @brief Terminate the array and flush. Later calls do nothing.
    void close();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// @brief One buffered record of a MemoryTraceWriter.
/// @ingroup io_writers
struct TraceRecord {
    using Value = std::variant<double, std::int64_t, std::string>;

    core::Minute time{0};
    std::string type;
    std::unordered_map<std::string, Value> fields;

    [[nodiscard]] std::optional<std::string> text(const std::string& key) const;
    [[nodiscard]] std::optional<std::int64_t> integer(const std::string& key) const;
};

/// @brief Keeps the whole trace in memory so tests can query it.
/// @ingroup io_writers
class MemoryTraceWriter : public core::TraceWriter {
public:
    void begin(core::Minute time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, std::int64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

    [[nodiscard]] const std::vector<TraceRecord>& records() const { return records_; }

    /// @brief Records of type @p name, in emission order.
    [[nodiscard]] std::vector<TraceRecord> records_of(std::string_view name) const;

    void clear() { records_.clear(); }

private:
    std::vector<TraceRecord> records_;
    TraceRecord pending_;
};

/// @brief One line per record, for a terminal.
/// @ingroup io_writers
///
///     [Tue 10:00] task_placed task=report start=Tue 10:00 end=Tue 11:00 priority=4
///
/// Integer fields named `start`, `end` or `deadline` hold minutes of the
/// week and are printed as weekday and clock time. With @p color the event
/// name is printed in bold.
class TextualTraceWriter : public core::TraceWriter {
public:
    explicit TextualTraceWriter(std::ostream& output, bool color = true);

    TextualTraceWriter(const TextualTraceWriter&) = delete;
    TextualTraceWriter& operator=(const TextualTraceWriter&) = delete;
    TextualTraceWriter(TextualTraceWriter&&) = delete;
    TextualTraceWriter& operator=(TextualTraceWriter&&) = delete;

    void begin(core::Minute time) override;
    void type(std::string_view name) override;
    void field(std::string_view key, double value) override;
    void field(std::string_view key, std::int64_t value) override;
    void field(std::string_view key, std::string_view value) override;
    void end() override;

private:
    std::ostream& out_;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    bool color_;
    std::string line_;
};

/// @brief `"Ddd HH:MM"` for a minute of the week, e.g. `"Tue 13:05"`.
/// @ingroup io_writers
[[nodiscard]] std::string format_minute(core::Minute minute);

} // namespace slotplan::io

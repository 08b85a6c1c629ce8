#include <slotplan/io/trace_writers.hpp>

#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/prettywriter.h>

#include <algorithm>
#include <array>
#include <cstdio>
#include <iterator>
#include <sstream>

namespace slotplan::io {

std::string format_minute(core::Minute minute) {
    static constexpr std::array<const char*, core::DAYS_PER_WEEK> days{
        "Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun"};

    int day = core::day_of(minute);
    core::Minutes in_day = core::minute_of_day(minute);
    std::string name = (day >= 0 && day < core::DAYS_PER_WEEK) ? days[static_cast<std::size_t>(day)]
                                                                : "D" + std::to_string(day);

    std::array<char, 8> clock{};
    std::snprintf(clock.data(), clock.size(), "%02d:%02d",
                  static_cast<int>(in_day / core::MINUTES_PER_HOUR),
                  static_cast<int>(in_day % core::MINUTES_PER_HOUR));
    return name + " " + clock.data();
}

// =============================================================================
// NullTraceWriter
// =============================================================================

void NullTraceWriter::begin(core::Minute /*time*/) {}
void NullTraceWriter::type(std::string_view /*name*/) {}
void NullTraceWriter::field(std::string_view /*key*/, double /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, std::int64_t /*value*/) {}
void NullTraceWriter::field(std::string_view /*key*/, std::string_view /*value*/) {}
void NullTraceWriter::end() {}

// =============================================================================
// JsonTraceWriter
// =============================================================================

struct JsonTraceWriter::Impl {
    explicit Impl(std::ostream& output)
        : output(output)
        , stream(output)
        , writer(stream) {
        writer.SetIndent(' ', 2);
    }

    void key(std::string_view name) {
        writer.Key(name.data(), static_cast<rapidjson::SizeType>(name.size()));
    }

    std::ostream& output;  // NOLINT(cppcoreguidelines-avoid-const-or-ref-data-members)
    rapidjson::OStreamWrapper stream;
    rapidjson::PrettyWriter<rapidjson::OStreamWrapper> writer;
    bool closed{false};
};

JsonTraceWriter::JsonTraceWriter(std::ostream& output)
    : impl_(std::make_unique<Impl>(output)) {
    impl_->writer.StartArray();
}

JsonTraceWriter::~JsonTraceWriter() {
    close();
}

void JsonTraceWriter::begin(core::Minute time) {
    if (impl_->closed) {
        return;
    }
    impl_->writer.StartObject();
    impl_->key("minute");
    impl_->writer.Int64(time);
}

void JsonTraceWriter::type(std::string_view name) {
    field("type", name);
}

void JsonTraceWriter::field(std::string_view key, double value) {
    if (!impl_->closed) {
        impl_->key(key);
        impl_->writer.Double(value);
    }
}

void JsonTraceWriter::field(std::string_view key, std::int64_t value) {
    if (!impl_->closed) {
        impl_->key(key);
        impl_->writer.Int64(value);
    }
}

void JsonTraceWriter::field(std::string_view key, std::string_view value) {
    if (!impl_->closed) {
        impl_->key(key);
        impl_->writer.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
    }
}

void JsonTraceWriter::end() {
    if (!impl_->closed) {
        impl_->writer.EndObject();
    }
}

void JsonTraceWriter::close() {
    if (impl_->closed) {
        return;
    }
    impl_->writer.EndArray();
    impl_->stream.Flush();
    impl_->output << '\n';
    impl_->output.flush();
    impl_->closed = true;
}

// =============================================================================
// MemoryTraceWriter
// =============================================================================

namespace {

template<typename T>
std::optional<T> lookup(const TraceRecord& record, const std::string& key) {
    auto it = record.fields.find(key);
    if (it == record.fields.end()) {
        return std::nullopt;
    }
    if (const auto* value = std::get_if<T>(&it->second)) {
        return *value;
    }
    return std::nullopt;
}

} // anonymous namespace

std::optional<std::string> TraceRecord::text(const std::string& key) const {
    return lookup<std::string>(*this, key);
}

std::optional<std::int64_t> TraceRecord::integer(const std::string& key) const {
    return lookup<std::int64_t>(*this, key);
}

void MemoryTraceWriter::begin(core::Minute time) {
    pending_ = TraceRecord{};
    pending_.time = time;
}

void MemoryTraceWriter::type(std::string_view name) {
    pending_.type.assign(name);
}

void MemoryTraceWriter::field(std::string_view key, double value) {
    pending_.fields.insert_or_assign(std::string(key), value);
}

void MemoryTraceWriter::field(std::string_view key, std::int64_t value) {
    pending_.fields.insert_or_assign(std::string(key), value);
}

void MemoryTraceWriter::field(std::string_view key, std::string_view value) {
    pending_.fields.insert_or_assign(std::string(key), std::string(value));
}

void MemoryTraceWriter::end() {
    records_.push_back(std::move(pending_));
    pending_ = TraceRecord{};
}

std::vector<TraceRecord> MemoryTraceWriter::records_of(std::string_view name) const {
    std::vector<TraceRecord> out;
    std::copy_if(records_.begin(), records_.end(), std::back_inserter(out),
                 [name](const TraceRecord& record) { return record.type == name; });
    return out;
}

// =============================================================================
// TextualTraceWriter
// =============================================================================

TextualTraceWriter::TextualTraceWriter(std::ostream& output, bool color)
    : out_(output)
    , color_(color) {}

void TextualTraceWriter::begin(core::Minute time) {
    line_ = "[" + format_minute(time) + "]";
}

void TextualTraceWriter::type(std::string_view name) {
    line_ += ' ';
    if (color_) {
        line_ += "\033[1m";
    }
    line_ += name;
    if (color_) {
        line_ += "\033[0m";
    }
}

void TextualTraceWriter::field(std::string_view key, double value) {
    std::ostringstream oss;
    oss.precision(10);
    oss << value;
    line_ += ' ';
    line_ += key;
    line_ += '=';
    line_ += oss.str();
}

void TextualTraceWriter::field(std::string_view key, std::int64_t value) {
    bool is_minute = key == "start" || key == "end" || key == "deadline";
    std::string text = is_minute ? format_minute(static_cast<core::Minute>(value)) : std::to_string(value);
    field(key, std::string_view(text));
}

void TextualTraceWriter::field(std::string_view key, std::string_view value) {
    line_ += ' ';
    line_ += key;
    line_ += '=';
    line_ += value;
}

void TextualTraceWriter::end() {
    out_ << line_ << '\n';
    line_.clear();
}

} // namespace slotplan::io

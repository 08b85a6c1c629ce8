#include <slotplan/io/report_writer.hpp>
#include <slotplan/io/error.hpp>

#include <slotplan/core/error.hpp>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <fstream>
#include <string_view>

namespace slotplan::io {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void write_string(JsonWriter& writer, std::string_view value) {
    writer.String(value.data(), static_cast<rapidjson::SizeType>(value.size()));
}

void write_placed(JsonWriter& writer, const core::Task& task) {
    writer.StartObject();

    writer.Key("id");
    write_string(writer, task.id);

    writer.Key("priority");
    writer.Int(task.priority);

    writer.Key("start");
    writer.Int(task.assigned->start);

    writer.Key("end");
    writer.Int(task.assigned->end);

    writer.Key("deadline");
    if (task.deadline) {
        writer.Int(*task.deadline);
    } else {
        writer.Null();
    }

    writer.Key("rescheduled");
    writer.Bool(task.rescheduled);

    writer.Key("dependencies");
    writer.StartArray();
    for (const auto& dep : task.dependencies) {
        write_string(writer, dep);
    }
    writer.EndArray();

    writer.EndObject();
}

} // anonymous namespace

void write_report(const algo::AllocationReport& report, std::span<const core::Task> tasks, std::ostream& out) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);

    writer.StartObject();

    writer.Key("summary");
    writer.StartObject();
    writer.Key("tasks");
    writer.Uint64(tasks.size());
    writer.Key("placed");
    writer.Uint64(report.placed.size());
    writer.Key("unplaced");
    writer.Uint64(report.unplaced.size());
    writer.Key("rescheduled");
    writer.Uint64(report.rescheduled);
    writer.Key("evictions");
    writer.Uint64(report.evictions);
    writer.Key("search_nodes");
    writer.Uint64(report.search_nodes);
    writer.Key("search_bounded");
    writer.Bool(report.search_bounded);
    writer.EndObject();

    writer.Key("placed");
    writer.StartArray();
    for (core::TaskIndex index : report.placed) {
        write_placed(writer, tasks[index]);
    }
    writer.EndArray();

    writer.Key("unplaced");
    writer.StartArray();
    for (const auto& entry : report.unplaced) {
        writer.StartObject();
        writer.Key("id");
        write_string(writer, tasks[entry.task].id);
        writer.Key("reason");
        write_string(writer, core::to_string(entry.reason));
        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();

    out << buffer.GetString() << "\n";
}

void write_report(const algo::AllocationReport& report, std::span<const core::Task> tasks,
                  const std::filesystem::path& path) {
    std::ofstream file(path);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    write_report(report, tasks, file);
}

} // namespace slotplan::io

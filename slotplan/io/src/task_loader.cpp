#include <slotplan/io/task_loader.hpp>
#include <slotplan/io/error.hpp>

#include <slotplan/core/error.hpp>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <unordered_set>
#include <utility>

namespace slotplan::io {

namespace {

// Helper to get required member with error context
const rapidjson::Value& get_member(const rapidjson::Value& obj, const char* name, const std::string& context) {
    if (!obj.HasMember(name)) {
        throw LoaderError(std::string("missing required field '") + name + "'", context);
    }
    return obj[name];
}

std::string get_string(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsString()) {
        throw LoaderError(std::string("field '") + name + "' must be a string", context);
    }
    return {member.GetString(), member.GetStringLength()};
}

const rapidjson::Value& get_array(const rapidjson::Value& val, const char* name, const std::string& context) {
    const auto& member = get_member(val, name, context);
    if (!member.IsArray()) {
        throw LoaderError(std::string("field '") + name + "' must be an array", context);
    }
    return member;
}

// Optional getters: a missing member and an explicit null both mean "absent"
bool is_absent(const rapidjson::Value& val, const char* name) {
    return !val.HasMember(name) || val[name].IsNull();
}

std::optional<int> get_optional_int(const rapidjson::Value& val, const char* name, const std::string& context) {
    if (is_absent(val, name)) {
        return std::nullopt;
    }
    const auto& member = val[name];
    if (!member.IsInt()) {
        throw LoaderError(std::string("field '") + name + "' must be an integer or null", context);
    }
    return member.GetInt();
}

// Optional integer that must lie in [low, high] when present
std::optional<int> get_optional_int_in(const rapidjson::Value& val, const char* name,
                                       int low, int high, const std::string& context) {
    auto value = get_optional_int(val, name, context);
    if (value && (*value < low || *value > high)) {
        throw LoaderError(std::string("field '") + name + "' must be between " + std::to_string(low) +
                              " and " + std::to_string(high) + ", got " + std::to_string(*value),
                          context);
    }
    return value;
}

int get_int_or(const rapidjson::Value& val, const char* name, int default_val, const std::string& context) {
    return get_optional_int(val, name, context).value_or(default_val);
}

bool get_bool_or(const rapidjson::Value& val, const char* name, bool default_val, const std::string& context) {
    if (is_absent(val, name)) {
        return default_val;
    }
    const auto& member = val[name];
    if (!member.IsBool()) {
        throw LoaderError(std::string("field '") + name + "' must be a boolean", context);
    }
    return member.GetBool();
}

void parse_grid(core::GridConfig& grid, const rapidjson::Value& obj) {
    const std::string ctx = "grid";
    if (!obj.IsObject()) {
        throw LoaderError("must be an object", ctx);
    }
    grid.working_start = get_int_or(obj, "working_start", grid.working_start, ctx);
    grid.working_end = get_int_or(obj, "working_end", grid.working_end, ctx);
    grid.break_interval = get_int_or(obj, "break_interval", grid.break_interval, ctx);
    grid.break_duration = get_int_or(obj, "break_duration", grid.break_duration, ctx);

    try {
        grid.validate();
    } catch (const core::GridConfigurationError& e) {
        throw LoaderError(e.what(), ctx);
    }
}

void parse_options(algo::AllocatorOptions& options, const rapidjson::Value& obj) {
    const std::string ctx = "options";
    if (!obj.IsObject()) {
        throw LoaderError("must be an object", ctx);
    }
    options.refine_lateness = get_bool_or(obj, "refine_lateness", options.refine_lateness, ctx);
    options.backtracking = get_bool_or(obj, "backtracking", options.backtracking, ctx);
    if (!is_absent(obj, "search_node_limit")) {
        const auto& member = obj["search_node_limit"];
        if (!member.IsUint64() || member.GetUint64() == 0) {
            throw LoaderError("field 'search_node_limit' must be a positive integer", ctx);
        }
        options.search_node_limit = static_cast<std::size_t>(member.GetUint64());
    }
}

core::Task parse_task(const rapidjson::Value& obj, const std::string& ctx) {
    if (!obj.IsObject()) {
        throw LoaderError("must be an object", ctx);
    }

    core::Task task;
    task.id = get_string(obj, "id", ctx);
    if (task.id.empty()) {
        throw LoaderError("id must not be empty", ctx);
    }
    task.priority = get_int_or(obj, "priority", 0, ctx);

    if (!is_absent(obj, "dependencies")) {
        const auto& deps = get_array(obj, "dependencies", ctx);
        for (rapidjson::SizeType i = 0; i < deps.Size(); ++i) {
            if (!deps[i].IsString()) {
                throw LoaderError("dependencies must be task ids", ctx);
            }
            task.dependencies.emplace_back(deps[i].GetString(), deps[i].GetStringLength());
        }
    }

    task.duration = get_optional_int_in(obj, "duration", 1, core::MINUTES_PER_WEEK, ctx);
    task.estimate = get_optional_int_in(obj, "estimate", 1, core::MINUTES_PER_WEEK, ctx);
    task.deadline = get_optional_int_in(obj, "deadline", 0, core::MINUTES_PER_WEEK, ctx);

    task.earliest_start = get_optional_int_in(obj, "earliest_start", 0, core::MINUTES_PER_WEEK, ctx);
    task.latest_start = get_optional_int_in(obj, "latest_start", 0, core::MINUTES_PER_WEEK, ctx);
    if (task.earliest_start && task.latest_start && *task.latest_start < *task.earliest_start) {
        throw LoaderError("latest_start must not be before earliest_start", ctx);
    }

    auto fixed_start = get_optional_int(obj, "fixed_start", ctx);
    auto fixed_end = get_optional_int(obj, "fixed_end", ctx);
    if (fixed_start.has_value() != fixed_end.has_value()) {
        throw LoaderError("fixed_start and fixed_end must be given together", ctx);
    }
    if (fixed_start) {
        if (*fixed_end <= *fixed_start) {
            throw LoaderError("fixed_end must be after fixed_start", ctx);
        }
        if (*fixed_start < 0 || *fixed_end > core::MINUTES_PER_WEEK) {
            throw LoaderError("fixed window must lie within the week", ctx);
        }
        task.fixed = core::Interval{*fixed_start, *fixed_end};
    }
    return task;
}

void parse_task_set_impl(TaskSetData& result, const rapidjson::Document& doc) {
    if (doc.HasMember("grid")) {
        parse_grid(result.grid, doc["grid"]);
    }
    if (doc.HasMember("options")) {
        parse_options(result.options, doc["options"]);
    }

    const auto& tasks = get_array(doc, "tasks", "task set");
    std::unordered_set<std::string> ids;
    for (rapidjson::SizeType tidx = 0; tidx < tasks.Size(); ++tidx) {
        std::string ctx = "tasks[" + std::to_string(tidx) + "]";
        auto task = parse_task(tasks[tidx], ctx);
        if (!ids.insert(task.id).second) {
            throw LoaderError("duplicate task id '" + task.id + "'", ctx);
        }
        result.tasks.push_back(std::move(task));
    }
}

} // anonymous namespace

TaskSetData load_task_set(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw LoaderError("cannot open file", path.string());
    }

    std::ostringstream oss;
    oss << file.rdbuf();
    return load_task_set_from_string(oss.str());
}

TaskSetData load_task_set_from_string(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());

    if (doc.HasParseError()) {
        throw LoaderError(
            std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()),
            "at offset " + std::to_string(doc.GetErrorOffset()));
    }

    if (!doc.IsObject()) {
        throw LoaderError("root must be an object", "task set");
    }

    TaskSetData result;
    parse_task_set_impl(result, doc);
    return result;
}

} // namespace slotplan::io

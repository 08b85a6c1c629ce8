#include <slotplan/core/error.hpp>
#include <slotplan/core/slot_grid.hpp>
#include <slotplan/core/task.hpp>

#include <slotplan/algo/slot_allocator.hpp>

#include <slotplan/io/calendar_export.hpp>
#include <slotplan/io/error.hpp>
#include <slotplan/io/report_writer.hpp>
#include <slotplan/io/task_loader.hpp>
#include <slotplan/io/trace_writers.hpp>

#include <cxxopts.hpp>

#include <charconv>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace {

namespace core = slotplan::core;
namespace algo = slotplan::algo;
namespace io = slotplan::io;

struct Config {
    std::string input_file;
    std::optional<std::string> output_file;
    std::optional<std::string> ics_file;
    std::optional<std::chrono::year_month_day> week_start;
    std::optional<std::string> trace_file;
    std::optional<int> working_start;
    std::optional<int> working_end;
    std::optional<int> break_interval;
    std::optional<int> break_duration;
    bool refine_lateness{false};
    bool no_backtracking{false};
    std::optional<std::size_t> node_limit;
    bool verbose{false};
};

// YYYY-MM-DD
std::optional<std::chrono::year_month_day> parse_date(std::string_view text) {
    int y = 0;
    unsigned m = 0;
    unsigned d = 0;
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    auto parse = [](std::string_view part, auto& value) {
        auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
        return ec == std::errc{} && ptr == part.data() + part.size();
    };
    if (!parse(text.substr(0, 4), y) || !parse(text.substr(5, 2), m) || !parse(text.substr(8, 2), d)) {
        return std::nullopt;
    }
    std::chrono::year_month_day date{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
    if (!date.ok()) {
        return std::nullopt;
    }
    return date;
}

Config parse_args(int argc, char** argv) {
    cxxopts::Options options("slotplan", "Weekly task slot allocator");

    // clang-format off
    options.add_options()
        ("i,input", "Task set (JSON)", cxxopts::value<std::string>())
        ("o,output", "Report file (JSON, default: stdout)", cxxopts::value<std::string>())
        ("ics", "Export placed tasks to an iCalendar file", cxxopts::value<std::string>())
        ("week-start", "Monday the week is anchored on, YYYY-MM-DD (required with --ics)",
            cxxopts::value<std::string>())
        ("trace", "Write the allocation trace to a JSON file", cxxopts::value<std::string>())
        ("working-start", "First working minute of each day (overrides the task set)",
            cxxopts::value<int>())
        ("working-end", "One past the last working minute of each day",
            cxxopts::value<int>())
        ("break-interval", "Periodic break cycle in minutes, 0 disables",
            cxxopts::value<int>())
        ("break-duration", "Rest after each task and periodic break length, in minutes",
            cxxopts::value<int>())
        ("refine-lateness", "Run the lateness-minimising pass")
        ("no-backtracking", "Skip the backtracking search")
        ("node-limit", "Backtracking node limit", cxxopts::value<std::size_t>())
        ("v,verbose", "Verbose stderr output")
        ("h,help", "Show help");
    // clang-format on

    auto result = options.parse(argc, argv);

    if (result.count("help") != 0U) {
        std::cout << options.help() << std::endl;
        std::exit(0);
    }

    if (result.count("input") == 0U) {
        std::cerr << "Error: --input is required" << std::endl;
        std::exit(64);
    }

    Config config;
    config.input_file = result["input"].as<std::string>();
    if (result.count("output") != 0U) {
        config.output_file = result["output"].as<std::string>();
    }
    if (result.count("ics") != 0U) {
        config.ics_file = result["ics"].as<std::string>();
        if (result.count("week-start") == 0U) {
            std::cerr << "Error: --ics requires --week-start" << std::endl;
            std::exit(64);
        }
    }
    if (result.count("week-start") != 0U) {
        config.week_start = parse_date(result["week-start"].as<std::string>());
        if (!config.week_start) {
            std::cerr << "Error: --week-start must be a date in YYYY-MM-DD form" << std::endl;
            std::exit(64);
        }
    }
    if (result.count("trace") != 0U) {
        config.trace_file = result["trace"].as<std::string>();
    }
    if (result.count("working-start") != 0U) {
        config.working_start = result["working-start"].as<int>();
    }
    if (result.count("working-end") != 0U) {
        config.working_end = result["working-end"].as<int>();
    }
    if (result.count("break-interval") != 0U) {
        config.break_interval = result["break-interval"].as<int>();
    }
    if (result.count("break-duration") != 0U) {
        config.break_duration = result["break-duration"].as<int>();
    }
    config.refine_lateness = result.count("refine-lateness") != 0U;
    config.no_backtracking = result.count("no-backtracking") != 0U;
    if (result.count("node-limit") != 0U) {
        config.node_limit = result["node-limit"].as<std::size_t>();
        if (*config.node_limit == 0) {
            std::cerr << "Error: --node-limit must be positive" << std::endl;
            std::exit(64);
        }
    }
    config.verbose = result.count("verbose") != 0U;

    return config;
}

void apply_overrides(const Config& config, io::TaskSetData& data) {
    if (config.working_start) {
        data.grid.working_start = *config.working_start;
    }
    if (config.working_end) {
        data.grid.working_end = *config.working_end;
    }
    if (config.break_interval) {
        data.grid.break_interval = *config.break_interval;
    }
    if (config.break_duration) {
        data.grid.break_duration = *config.break_duration;
    }
    if (config.refine_lateness) {
        data.options.refine_lateness = true;
    }
    if (config.no_backtracking) {
        data.options.backtracking = false;
    }
    if (config.node_limit) {
        data.options.search_node_limit = *config.node_limit;
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        Config config = parse_args(argc, argv);

        if (config.verbose) {
            std::cerr << "Loading task set from: " << config.input_file << std::endl;
        }

        // 1. Load task set and apply command-line overrides
        auto data = io::load_task_set(config.input_file);
        apply_overrides(config, data);

        if (config.verbose) {
            std::cerr << "Loaded " << data.tasks.size() << " tasks, working hours "
                      << data.grid.working_start << "-" << data.grid.working_end
                      << ", break " << data.grid.break_duration << " min" << std::endl;
        }

        // 2. Set up trace writer: JSON file if requested, text on stderr if verbose
        std::ofstream trace_stream;
        std::unique_ptr<core::TraceWriter> trace_writer;
        if (config.trace_file) {
            trace_stream.open(*config.trace_file);
            if (!trace_stream) {
                throw io::LoaderError("cannot open file for writing", *config.trace_file);
            }
            trace_writer = std::make_unique<io::JsonTraceWriter>(trace_stream);
        } else if (config.verbose) {
            trace_writer = std::make_unique<io::TextualTraceWriter>(std::cerr, false);
        }

        // 3. Allocate
        algo::SlotAllocator allocator(data.grid, data.options);
        auto report = allocator.allocate(data.tasks, trace_writer.get());
        trace_writer.reset();

        if (config.verbose) {
            std::cerr << "Placed " << report.placed.size() << "/" << data.tasks.size()
                      << " tasks, " << report.evictions << " evictions, "
                      << report.search_nodes << " search nodes"
                      << (report.search_bounded ? " (bounded)" : "") << std::endl;
        }

        // 4. Write report
        if (config.output_file) {
            io::write_report(report, data.tasks, *config.output_file);
        } else {
            io::write_report(report, data.tasks, std::cout);
        }

        // 5. Calendar export
        if (config.ics_file) {
            io::export_ics(data.tasks, *config.week_start, *config.ics_file);
            if (config.verbose) {
                std::cerr << "Calendar written to: " << *config.ics_file << std::endl;
            }
        }

        return 0;
    }
    catch (const io::LoaderError& e) {
        std::cerr << "Config error: " << e.what() << std::endl;
        return 1;
    }
    catch (const core::SchedulingError& e) {
        std::cerr << "Allocation failed: " << e.what() << std::endl;
        return 1;
    }
    catch (const cxxopts::exceptions::parsing& e) {
        std::cerr << "Invalid args: " << e.what() << std::endl;
        return 64;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

#include <slotplan/io/calendar_export.hpp>
#include <slotplan/io/error.hpp>
#include <slotplan/io/trace_writers.hpp>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace slotplan::io {

namespace {

constexpr std::size_t MAX_LINE_OCTETS = 75;

// iCalendar priority: 1 is highest, 9 lowest, 0 undefined
int ics_priority(int priority) {
    return std::clamp(10 - priority, 1, 9);
}

std::string format_datetime(std::chrono::sys_days week_start, core::Minute minute) {
    using namespace std::chrono;

    auto point = week_start + minutes{minute};
    auto day = floor<days>(point);
    year_month_day ymd{day};
    hh_mm_ss hms{point - day};

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << static_cast<int>(ymd.year())
        << std::setw(2) << static_cast<unsigned>(ymd.month())
        << std::setw(2) << static_cast<unsigned>(ymd.day())
        << 'T'
        << std::setw(2) << hms.hours().count()
        << std::setw(2) << hms.minutes().count()
        << "00";
    return oss.str();
}

std::string escape_text(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case ';':  out += "\\;"; break;
            case ',':  out += "\\,"; break;
            case '\n': out += "\\n"; break;
            default:   out += c;
        }
    }
    return out;
}

bool is_continuation_byte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Content lines longer than 75 octets are folded with CRLF + space. A fold
// never lands inside a UTF-8 sequence.
void write_line(std::ostream& out, std::string_view line) {
    std::size_t limit = MAX_LINE_OCTETS;
    while (line.size() > limit) {
        std::size_t cut = limit;
        while (cut > 0 && is_continuation_byte(line[cut])) {
            --cut;
        }
        if (cut == 0) {
            cut = limit;
        }
        out << line.substr(0, cut) << "\r\n ";
        line.remove_prefix(cut);
        limit = MAX_LINE_OCTETS - 1;
    }
    out << line << "\r\n";
}

std::string describe(const core::Task& task) {
    std::string text = "Priority: " + std::to_string(task.priority);
    if (!task.dependencies.empty()) {
        text += "\nDependencies: ";
        for (std::size_t i = 0; i < task.dependencies.size(); ++i) {
            if (i > 0) {
                text += ", ";
            }
            text += task.dependencies[i];
        }
    }
    if (task.deadline) {
        text += "\nDeadline: " + format_minute(*task.deadline);
    }
    if (task.estimate) {
        text += "\nEstimated time: " + std::to_string(*task.estimate) + " min";
    }
    if (task.rescheduled) {
        text += "\nRescheduled";
    }
    return text;
}

} // anonymous namespace

void export_ics(std::span<const core::Task> tasks, std::chrono::year_month_day week_start, std::ostream& out) {
    using namespace std::chrono;

    if (!week_start.ok()) {
        throw LoaderError("invalid date", "week start");
    }
    sys_days monday{week_start};
    if (weekday{monday} != Monday) {
        throw LoaderError("must be a Monday", "week start");
    }
    const std::string stamp = format_datetime(monday, 0);

    write_line(out, "BEGIN:VCALENDAR");
    write_line(out, "VERSION:2.0");
    write_line(out, "PRODID:-//slotplan//weekly allocation//EN");
    write_line(out, "CALSCALE:GREGORIAN");

    for (const auto& task : tasks) {
        if (!task.assigned) {
            continue;
        }
        write_line(out, "BEGIN:VEVENT");
        write_line(out, "UID:" + escape_text(task.id) + "@slotplan");
        write_line(out, "DTSTAMP:" + stamp);
        write_line(out, "DTSTART:" + format_datetime(monday, task.assigned->start));
        write_line(out, "DTEND:" + format_datetime(monday, task.assigned->end));
        write_line(out, "SUMMARY:" + escape_text(task.id));
        write_line(out, "PRIORITY:" + std::to_string(ics_priority(task.priority)));
        write_line(out, "DESCRIPTION:" + escape_text(describe(task)));
        write_line(out, "END:VEVENT");
    }

    write_line(out, "END:VCALENDAR");
}

void export_ics(std::span<const core::Task> tasks, std::chrono::year_month_day week_start,
                const std::filesystem::path& path) {
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        throw LoaderError("cannot open file for writing", path.string());
    }
    export_ics(tasks, week_start, file);
}

} // namespace slotplan::io

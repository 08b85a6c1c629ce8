#pragma once

/// @file error.hpp
/// @brief Exception type of the slotplan I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace slotplan::io {

/// @brief Raised when a task set cannot be read or an output cannot be written.
///
/// Covers malformed JSON, missing or mistyped fields, invalid grid
/// parameters and fixed windows, and unwritable report or calendar paths.
///
/// @ingroup io
/// @see load_task_set, write_report, export_ics
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Message becomes `"<context>: <message>"`, where @p context is
    ///        a path or a location such as `tasks[3]`.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

} // namespace slotplan::io

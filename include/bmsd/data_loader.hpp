#pragma once

/// @file include/bmsd/data_loader.hpp
/// @brief TraceLoader — experimental (t, x, y) CSV traces.
///
/// # Module: Trace Loader
///
/// ## Expected CSV Format
/// ```
/// t,x,y
/// 0.00,1.2e-7,3.4e-7
/// 0.05,1.5e-7,3.1e-7
/// ```
/// Time in seconds, positions in metres. The header names the columns, in
/// any order and case; `time` is accepted for `t`, and extra columns are
/// ignored. Blank lines and lines starting with `#` are skipped.
///
/// ## Guarantees
/// - Rejects the whole file on the first bad row; never returns a partial
///   trace
/// - Every error is MalformedInput and names the line and column

#include "bmsd/trajectory.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace bmsd {

class TraceLoader {
public:
    TraceLoader() = delete;

    /// Load a trace from a CSV file on disk.
    ///
    /// # Throws
    /// MalformedInput if the file cannot be opened or its content is
    /// malformed (see `parse_csv_string`).
    [[nodiscard]] static Trajectory load_csv(const std::string& filepath);

    /// Parse a trace from CSV text.
    ///
    /// # Throws
    /// MalformedInput on a missing header or required column, a short row,
    /// a non-numeric or non-finite cell, no data rows, or a time column that
    /// is not strictly increasing.
    [[nodiscard]] static Trajectory parse_csv_string(const std::string& csv_content);

private:
    struct Columns {
        std::size_t t;
        std::size_t x;
        std::size_t y;
        std::size_t count;
    };

    [[nodiscard]] static Columns locate_columns(const std::string& header);

    [[nodiscard]] static double parse_cell(std::string_view token,
                                           std::size_t line_no,
                                           std::string_view column);
};

} // namespace bmsd

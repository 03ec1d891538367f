/// @file src/core/data_loader.cpp
/// @brief TraceLoader — CSV (t, x, y) traces into Trajectory.

#include "bmsd/data_loader.hpp"
#include "bmsd/errors.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace bmsd {

namespace {

/// Trim leading/trailing whitespace.
std::string_view trim(std::string_view s) noexcept {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

/// Split a CSV line on commas (numeric data, no quoting).
std::vector<std::string_view> split_csv(std::string_view line) {
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true) {
        const auto comma = line.find(',', start);
        if (comma == std::string_view::npos) {
            fields.push_back(trim(line.substr(start)));
            break;
        }
        fields.push_back(trim(line.substr(start, comma - start)));
        start = comma + 1;
    }
    return fields;
}

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// Blank lines and `#` comments carry no data.
bool is_skippable(std::string_view line) noexcept {
    const auto body = trim(line);
    return body.empty() || body.front() == '#';
}

}  // namespace

// ─── TraceLoader::locate_columns ──────────────────────────────────────────────

TraceLoader::Columns TraceLoader::locate_columns(const std::string& header) {
    const auto names = split_csv(header);

    std::optional<std::size_t> t, x, y;
    for (std::size_t i = 0; i < names.size(); ++i) {
        const auto name = lowercase(names[i]);
        if ((name == "t" || name == "time") && !t) t = i;
        else if (name == "x" && !x)                x = i;
        else if (name == "y" && !y)                y = i;
    }

    if (!t || !x || !y) {
        std::vector<std::string_view> missing;
        if (!t) missing.emplace_back("t");
        if (!x) missing.emplace_back("x");
        if (!y) missing.emplace_back("y");
        throw MalformedInput(fmt::format(
            "header '{}' is missing required column(s): {}",
            header, fmt::join(missing, ", ")));
    }
    return Columns{.t = *t, .x = *x, .y = *y, .count = names.size()};
}

// ─── TraceLoader::parse_cell ──────────────────────────────────────────────────

double TraceLoader::parse_cell(std::string_view token,
                               std::size_t line_no,
                               std::string_view column) {
    std::string_view digits = token;
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
    }

    double value = 0.0;
    const auto* begin = digits.data();
    const auto* end   = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (digits.empty() || ec != std::errc{} || ptr != end) {
        throw MalformedInput(fmt::format(
            "line {}: column '{}' is not numeric: '{}'", line_no, column, token));
    }
    if (!std::isfinite(value)) {
        throw MalformedInput(fmt::format(
            "line {}: column '{}' is not a finite real value: '{}'", line_no, column, token));
    }
    return value;
}

// ─── TraceLoader::parse_csv_string ────────────────────────────────────────────

Trajectory TraceLoader::parse_csv_string(const std::string& csv_content) {
    std::istringstream stream(csv_content);
    std::string line;
    std::size_t line_no = 0;

    std::optional<Columns> columns;
    std::vector<double> t, x, y;

    while (std::getline(stream, line)) {
        ++line_no;
        if (is_skippable(line)) {
            continue;
        }

        // First non-empty, non-comment line is the header.
        if (!columns) {
            columns = locate_columns(line);
            continue;
        }

        const auto fields = split_csv(line);
        if (fields.size() < columns->count) {
            throw MalformedInput(fmt::format(
                "line {}: expected {} fields, found {}", line_no, columns->count, fields.size()));
        }
        t.push_back(parse_cell(fields[columns->t], line_no, "t"));
        x.push_back(parse_cell(fields[columns->x], line_no, "x"));
        y.push_back(parse_cell(fields[columns->y], line_no, "y"));
    }

    if (!columns) {
        throw MalformedInput("CSV has no header row");
    }
    if (t.empty()) {
        throw MalformedInput("CSV has a header but no data rows");
    }
    return TrajectoryBuilder::from_samples(std::move(t), x, y);
}

// ─── TraceLoader::load_csv ────────────────────────────────────────────────────

Trajectory TraceLoader::load_csv(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw MalformedInput(fmt::format("cannot open input file '{}'", filepath));
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return parse_csv_string(contents.str());
}

}  // namespace bmsd

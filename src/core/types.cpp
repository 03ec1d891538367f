/// @file src/core/types.cpp
/// @brief Names and parsers for the shared enumerations.

#include "bmsd/types.hpp"

#include <algorithm>
#include <cctype>

namespace bmsd {

std::string_view to_string(DampingRegime regime) noexcept {
    switch (regime) {
        case DampingRegime::Overdamped:  return "overdamped";
        case DampingRegime::Underdamped: return "underdamped";
    }
    return "unknown";
}

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                      [](unsigned char l, unsigned char r) {
                          return std::tolower(l) == std::tolower(r);
                      });
}

}  // namespace

std::optional<DampingRegime> parse_damping_regime(std::string_view text) noexcept {
    // Trim surrounding whitespace.
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return std::nullopt;
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    text = text.substr(first, last - first + 1);

    if (iequals(text, "underdamped")) return DampingRegime::Underdamped;
    if (iequals(text, "overdamped"))  return DampingRegime::Overdamped;

    // Answer to "use underdamped Langevin? (yes/no)".
    if (iequals(text, "y") || iequals(text, "yes")) return DampingRegime::Underdamped;
    if (iequals(text, "n") || iequals(text, "no"))  return DampingRegime::Overdamped;

    return std::nullopt;
}

}  // namespace bmsd

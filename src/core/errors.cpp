/// @file src/core/errors.cpp
/// @brief Error taxonomy.

#include "bmsd/errors.hpp"

namespace bmsd {

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidParameter:   return "InvalidParameter";
        case ErrorKind::MalformedInput:     return "MalformedInput";
        case ErrorKind::InsufficientData:   return "InsufficientData";
        case ErrorKind::NumericInstability: return "NumericInstability";
    }
    return "Unknown";
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

}  // namespace bmsd

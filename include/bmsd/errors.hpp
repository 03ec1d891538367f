#pragma once

/// @file include/bmsd/errors.hpp
/// @brief Error taxonomy for the bmsd pipeline.
///
/// Every failure is terminal for the current run; nothing is retried and no
/// partial Trajectory or MSDCurve is ever returned. Callers that need to
/// branch on the category can catch the concrete type or switch on
/// `Error::kind()`.

#include <stdexcept>
#include <string>
#include <string_view>

namespace bmsd {

/// Category tag carried by every bmsd exception.
enum class ErrorKind {
    InvalidParameter,    ///< Non-positive mass/radius/dt/duration, bad regime
    MalformedInput,      ///< Missing column, non-increasing time, non-numeric cell
    InsufficientData,    ///< Too few usable points for a fit or an estimate
    NumericInstability,  ///< dt too coarse for m/γ, or integration diverged
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/// Base class of all bmsd errors.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message);

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class InvalidParameter : public Error {
public:
    explicit InvalidParameter(const std::string& message)
        : Error(ErrorKind::InvalidParameter, message) {}
};

class MalformedInput : public Error {
public:
    explicit MalformedInput(const std::string& message)
        : Error(ErrorKind::MalformedInput, message) {}
};

class InsufficientData : public Error {
public:
    explicit InsufficientData(const std::string& message)
        : Error(ErrorKind::InsufficientData, message) {}
};

class NumericInstability : public Error {
public:
    explicit NumericInstability(const std::string& message)
        : Error(ErrorKind::NumericInstability, message) {}
};

} // namespace bmsd

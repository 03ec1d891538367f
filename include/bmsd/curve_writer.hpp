#pragma once

/// @file include/bmsd/curve_writer.hpp
/// @brief CurveWriter — numeric CSV output for external plotting.
///
/// Writes the MSD curve, its log10 representation and the fitted line so a
/// plotting tool can render the log-log plot without touching the core.
/// Columns: `lag,msd,log10_lag,log10_msd,fit`. Log columns are empty where
/// the logarithm is undefined; `fit` is empty outside the fitted lag range.

#include "bmsd/msd.hpp"
#include "bmsd/regime.hpp"
#include "bmsd/trajectory.hpp"

#include <optional>
#include <string>

namespace bmsd {

class CurveWriter {
public:
    CurveWriter() = delete;

    [[nodiscard]] static std::string
    to_csv(const MSDCurve& curve,
           const std::optional<RegimeReport>& report = std::nullopt);

    /// `t,x,y[,vx,vy]`, readable back by TraceLoader.
    [[nodiscard]] static std::string trajectory_csv(const Trajectory& trajectory);

    /// Write `content` to `path`, replacing any existing file.
    ///
    /// # Throws
    /// std::runtime_error if the file cannot be written.
    static void write_file(const std::string& path, const std::string& content);
};

} // namespace bmsd

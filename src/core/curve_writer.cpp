/// @file src/core/curve_writer.cpp
/// @brief CurveWriter — plot-feed CSV.

#include "bmsd/curve_writer.hpp"

#include <fmt/format.h>

#include <cmath>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace bmsd {

std::string CurveWriter::to_csv(const MSDCurve& curve,
                                const std::optional<RegimeReport>& report) {
    std::string out = "lag,msd,log10_lag,log10_msd,fit\n";
    auto sink = std::back_inserter(out);

    for (std::size_t i = 0; i < curve.size(); ++i) {
        const double lag = curve.lag[i];
        const double msd = curve.msd[i];
        fmt::format_to(sink, "{:.10e},{:.10e},", lag, msd);

        if (lag > 0.0 && msd > 0.0) {
            fmt::format_to(sink, "{:.8f},{:.8f},", std::log10(lag), std::log10(msd));
        } else {
            fmt::format_to(sink, ",,");
        }

        if (report && lag >= report->lag_min && lag <= report->lag_max) {
            fmt::format_to(sink, "{:.10e}", report->fitted(lag));
        }
        out.push_back('\n');
    }
    return out;
}

std::string CurveWriter::trajectory_csv(const Trajectory& trajectory) {
    const bool with_velocity = trajectory.has_velocity();
    std::string out = with_velocity ? "t,x,y,vx,vy\n" : "t,x,y\n";
    auto sink = std::back_inserter(out);

    for (std::size_t i = 0; i < trajectory.size(); ++i) {
        const Vec2& r = trajectory.position(i);
        fmt::format_to(sink, "{:.17g},{:.17g},{:.17g}", trajectory.time(i), r.x(), r.y());
        if (with_velocity) {
            const Vec2& v = trajectory.velocity(i);
            fmt::format_to(sink, ",{:.17g},{:.17g}", v.x(), v.y());
        }
        out.push_back('\n');
    }
    return out;
}

void CurveWriter::write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open output file: " + path);
    }
    file << content;
    if (!file) {
        throw std::runtime_error("Failed writing output file: " + path);
    }
}

}  // namespace bmsd

/// @file src/trajectory/trajectory.cpp
/// @brief Trajectory — immutable planar time series.

#include "bmsd/trajectory.hpp"
#include "bmsd/errors.hpp"

#include <fmt/format.h>

#include <utility>

namespace bmsd {

Trajectory::Trajectory(std::shared_ptr<const TimeGrid> grid,
                       std::vector<Vec2>               positions,
                       std::vector<Vec2>               velocities)
    : grid_(std::move(grid)),
      positions_(std::move(positions)),
      velocities_(std::move(velocities)) {
    if (!grid_) {
        throw MalformedInput("trajectory requires a time grid");
    }
    if (positions_.size() != grid_->size()) {
        throw MalformedInput(fmt::format(
            "trajectory has {} positions for {} sample times",
            positions_.size(), grid_->size()));
    }
    if (!velocities_.empty() && velocities_.size() != positions_.size()) {
        throw MalformedInput(fmt::format(
            "trajectory has {} velocities for {} positions",
            velocities_.size(), positions_.size()));
    }
}

std::vector<double> Trajectory::axis(int component) const {
    if (component < 0 || component > 1) {
        throw InvalidParameter(fmt::format("axis index must be 0 or 1 (got {})", component));
    }
    std::vector<double> out;
    out.reserve(positions_.size());
    for (const auto& r : positions_) {
        out.push_back(r[component]);
    }
    return out;
}

}  // namespace bmsd

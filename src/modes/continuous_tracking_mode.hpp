#pragma once

#include "modes/pathfinding_mode.hpp"

#include <functional>
#include <vector>

namespace airpath::path {
class PathfindingCore;
}

namespace airpath::modes {

using PositionProvider = std::function<Vector3()>;

/// Follows a moving target. Each update samples the target and the tracking
/// origin (e.g. a swarm centroid), and re-searches from origin to target when
/// the core's throttle allows it.
class ContinuousTrackingMode final : public PathfindingMode {
public:
    ContinuousTrackingMode(path::PathfindingCore& core, PositionProvider target,
                           PositionProvider origin, f32 height_offset = 0.0f);

    const char* name() const override { return "ContinuousTracking"; }

    /// Resets the throttle so the first update always searches.
    void activate(f64 now) override;
    void deactivate() override;
    std::optional<path::PathResult> update(f64 now) override;

    bool active() const { return active_; }
    u32 recalculation_count() const { return recalculations_; }

    void set_height_offset(f32 offset) { height_offset_ = offset; }

private:
    path::PathfindingCore& core_;
    PositionProvider target_;
    PositionProvider origin_;
    f32 height_offset_;
    bool active_ = false;
    u32 recalculations_ = 0;
};

/// Mean position of a group of agents; (0, 0, 0) for an empty group.
Vector3 swarm_centroid(const std::vector<Vector3>& positions);

} // namespace airpath::modes

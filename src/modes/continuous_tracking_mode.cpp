#include "modes/continuous_tracking_mode.hpp"
#include "path/pathfinding_core.hpp"

#include <cmath>
#include <spdlog/spdlog.h>

namespace airpath::modes {

ContinuousTrackingMode::ContinuousTrackingMode(path::PathfindingCore& core,
                                               PositionProvider target,
                                               PositionProvider origin,
                                               f32 height_offset)
    : core_(core),
      target_(std::move(target)),
      origin_(std::move(origin)),
      height_offset_(height_offset) {}

void ContinuousTrackingMode::activate(f64) {
    core_.throttle().reset();
    recalculations_ = 0;
    active_ = true;
}

void ContinuousTrackingMode::deactivate() {
    active_ = false;
}

std::optional<path::PathResult> ContinuousTrackingMode::update(f64 now) {
    if (!active_ || !target_ || !origin_) return std::nullopt;

    const Vector3 target = target_();
    const Vector3 origin = origin_();

    auto tgt = core_.world_to_grid(target, true);
    auto org = core_.world_to_grid(origin, true);
    if (!tgt.ok() || !org.ok()) {
        spdlog::debug("ContinuousTrackingMode: core not initialized");
        return std::nullopt;
    }

    const f32 dx = target.x - origin.x;
    const f32 dz = target.z - origin.z;
    const f32 distance = std::sqrt(dx * dx + dz * dz);

    if (!core_.should_recalculate(now, tgt.value().pos, org.value().pos, distance))
        return std::nullopt;

    ++recalculations_;
    return core_.calculate_path(org.value().pos, tgt.value().pos, height_offset_);
}

Vector3 swarm_centroid(const std::vector<Vector3>& positions) {
    Vector3 c;
    if (positions.empty()) return c;
    for (const auto& p : positions) {
        c.x += p.x;
        c.y += p.y;
        c.z += p.z;
    }
    const f32 inv = 1.0f / static_cast<f32>(positions.size());
    c.x *= inv;
    c.y *= inv;
    c.z *= inv;
    return c;
}

} // namespace airpath::modes

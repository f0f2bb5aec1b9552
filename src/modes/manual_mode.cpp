#include "modes/manual_mode.hpp"
#include "path/pathfinding_core.hpp"

#include <spdlog/spdlog.h>

namespace airpath::modes {

ManualMode::ManualMode(path::PathfindingCore& core, f32 height_offset)
    : core_(core), height_offset_(height_offset) {}

void ManualMode::activate(f64) {
    active_ = true;
}

void ManualMode::deactivate() {
    active_ = false;
    pending_.reset();
}

void ManualMode::request(const Vector3& start, const Vector3& end) {
    if (pending_) {
        spdlog::debug("ManualMode: replacing unprocessed request");
    }
    pending_ = Pending{start, end};
}

std::optional<path::PathResult> ManualMode::update(f64) {
    if (!active_ || !pending_) return std::nullopt;

    Pending p = *pending_;
    pending_.reset();
    return core_.calculate_path(p.start, p.end, height_offset_);
}

} // namespace airpath::modes

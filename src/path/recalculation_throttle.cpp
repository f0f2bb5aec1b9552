#include "path/recalculation_throttle.hpp"
#include "grid/boundary_handler.hpp"

#include <algorithm>
#include <cmath>

namespace airpath::path {

static ThrottleSettings sanitize(ThrottleSettings s) {
    if (!(s.min_interval >= 0.0)) s.min_interval = 0.0;
    s.target_threshold = std::max(0, s.target_threshold);
    s.origin_threshold = std::max(0, s.origin_threshold);
    if (!(s.distance_start >= 0.0f)) s.distance_start = 0.0f;
    if (!(s.distance_range >= 0.0f)) s.distance_range = 0.0f;
    if (!(s.max_interval_multiplier >= 1.0f)) s.max_interval_multiplier = 1.0f;
    return s;
}

RecalculationThrottle::RecalculationThrottle(const ThrottleSettings& settings)
    : settings_(sanitize(settings)) {}

void RecalculationThrottle::set_settings(const ThrottleSettings& settings) {
    settings_ = sanitize(settings);
}

f64 RecalculationThrottle::effective_min_interval(f32 distance_to_target) const {
    const f64 base = settings_.min_interval;
    if (!settings_.distance_throttling || !std::isfinite(distance_to_target))
        return base;

    const f32 beyond = distance_to_target - settings_.distance_start;
    if (beyond <= 0.0f) return base;

    // Zero range: step straight to the maximum once past the start distance
    f32 t = settings_.distance_range > 0.0f
                ? std::min(1.0f, beyond / settings_.distance_range)
                : 1.0f;
    const f64 mult = 1.0 + (settings_.max_interval_multiplier - 1.0f) * t;
    return base * mult;
}

bool RecalculationThrottle::should_recalculate(f64 now,
                                               const grid::GridPos& target,
                                               const grid::GridPos& origin,
                                               f32 distance_to_target) {
    bool trigger = false;
    if (!state_.has_baseline) {
        trigger = true;
    } else {
        const f64 elapsed = now - state_.last_time;
        if (elapsed >= effective_min_interval(distance_to_target)) {
            const i32 target_moved =
                grid::BoundaryHandler::cell_displacement(target, state_.last_target);
            const i32 origin_moved =
                grid::BoundaryHandler::cell_displacement(origin, state_.last_origin);
            trigger = target_moved >= settings_.target_threshold ||
                      origin_moved >= settings_.origin_threshold;
        }
    }

    if (trigger) {
        state_.has_baseline = true;
        state_.last_time = now;
        state_.last_target = target;
        state_.last_origin = origin;
    }
    return trigger;
}

} // namespace airpath::path

#pragma once

#include "core/types.hpp"
#include "grid/grid_types.hpp"

namespace airpath::path {

struct ThrottleSettings {
    f64 min_interval = 0.5;       // seconds between recalculations
    i32 target_threshold = 2;     // cells the target must move
    i32 origin_threshold = 2;     // cells the tracking origin must move

    // Distance-based throttling: beyond distance_start the interval grows
    // linearly over distance_range up to max_interval_multiplier.
    bool distance_throttling = false;
    f32 distance_start = 50.0f;
    f32 distance_range = 200.0f;
    f32 max_interval_multiplier = 3.0f;
};

struct ThrottleState {
    bool has_baseline = false;
    f64 last_time = 0;
    grid::GridPos last_target;
    grid::GridPos last_origin;
};

/// Decides when a moving-target search should be re-issued.
/// Recalculation happens when elapsed >= effective interval and either the
/// target or the origin moved at least its threshold. The first query after
/// construction or reset() always triggers. State changes only on trigger.
class RecalculationThrottle {
public:
    explicit RecalculationThrottle(const ThrottleSettings& settings = {});

    bool should_recalculate(f64 now, const grid::GridPos& target,
                            const grid::GridPos& origin,
                            f32 distance_to_target);

    /// Minimum interval after distance scaling. Non-decreasing in distance.
    f64 effective_min_interval(f32 distance_to_target) const;

    void reset() { state_ = ThrottleState{}; }

    const ThrottleState& state() const { return state_; }
    const ThrottleSettings& settings() const { return settings_; }
    void set_settings(const ThrottleSettings& settings);

private:
    ThrottleSettings settings_;
    ThrottleState state_;
};

} // namespace airpath::path

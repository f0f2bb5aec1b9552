#include "grid/cost_model.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace airpath::grid {

EdgeCost edge_cost_terms(f32 from_elevation, f32 to_elevation, StepKind step,
                         f32 cell_size, f32 cost_multiplier) {
    EdgeCost c;
    c.movement = (step == StepKind::Diagonal ? SQRT2 : 1.0f) * cell_size;

    // Flat-earth fast path: no elevation term can contribute.
    if (cost_multiplier == 0.0f) return c;

    const f32 delta = to_elevation - from_elevation;
    c.altitude = std::max(0.0f, to_elevation) * cost_multiplier * ALTITUDE_WEIGHT;
    c.climb = std::max(0.0f, delta) * cost_multiplier * CLIMB_WEIGHT;
    c.slope = std::fabs(delta) * cost_multiplier * SLOPE_WEIGHT;
    return c;
}

f32 octile_distance(i32 dx, i32 dy, f32 cell_size) {
    const f32 ax = static_cast<f32>(std::abs(dx));
    const f32 ay = static_cast<f32>(std::abs(dy));
    const f32 mn = std::min(ax, ay);
    const f32 mx = std::max(ax, ay);
    return (mx + (SQRT2 - 1.0f) * mn) * cell_size;
}

} // namespace airpath::grid

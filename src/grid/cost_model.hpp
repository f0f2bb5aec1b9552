#pragma once

#include "core/types.hpp"
#include "grid/grid_types.hpp"

namespace airpath::grid {

static constexpr f32 SQRT2 = 1.41421356f;

// Per-unit-elevation weights applied on top of the cost multiplier.
static constexpr f32 ALTITUDE_WEIGHT = 0.01f;
static constexpr f32 CLIMB_WEIGHT = 0.5f;
static constexpr f32 SLOPE_WEIGHT = 0.1f;

/// Breakdown of a single step's cost. All terms are >= 0.
struct EdgeCost {
    f32 movement = 0;
    f32 altitude = 0;
    f32 climb = 0;
    f32 slope = 0;

    f32 total() const { return movement + altitude + climb + slope; }
};

/// Cost of stepping between two neighbouring cells, term by term.
///   movement = (diagonal ? sqrt2 : 1) * cell_size
///   altitude = max(0, to) * multiplier * 0.01
///   climb    = max(0, to - from) * multiplier * 0.5
///   slope    = |to - from| * multiplier * 0.1
/// Elevations below zero pay no altitude cost so every term stays non-negative.
EdgeCost edge_cost_terms(f32 from_elevation, f32 to_elevation, StepKind step,
                         f32 cell_size, f32 cost_multiplier);

inline f32 edge_cost(f32 from_elevation, f32 to_elevation, StepKind step,
                     f32 cell_size, f32 cost_multiplier) {
    return edge_cost_terms(from_elevation, to_elevation, step, cell_size,
                           cost_multiplier)
        .total();
}

/// Octile distance between two cells, scaled by cell size.
/// Never exceeds the true remaining cost because every edge pays at least
/// its flat movement term.
f32 octile_distance(i32 dx, i32 dy, f32 cell_size);

inline f32 octile_distance(const GridPos& a, const GridPos& b, f32 cell_size) {
    return octile_distance(b.x - a.x, b.y - a.y, cell_size);
}

} // namespace airpath::grid

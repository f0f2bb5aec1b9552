#pragma once

#include "core/types.hpp"
#include "grid/grid_types.hpp"
#include "path/path_types.hpp"

#include <functional>

namespace airpath::path {

struct BoundaryViolationEvent {
    grid::GridPos original;
    grid::GridPos clamped;
    bool auto_clamped = false; // false: the request was rejected instead
};

/// Outbound notifications. Either callback may be empty. Whatever delivers
/// them further (event bus, UI, logging) lives outside the pathfinding core.
struct PathEvents {
    std::function<void(const PathResult&)> on_path_calculated;
    std::function<void(const BoundaryViolationEvent&)> on_boundary_violation;
};

} // namespace airpath::path

#pragma once

#include "core/types.hpp"
#include "grid/grid_types.hpp"

#include <vector>

namespace airpath::path {

enum class PathStatus : u8 {
    Success,
    NoPathFound,            // open set exhausted
    IterationLimitExceeded, // safety cap reached
    Uninitialized,          // no grid loaded
    OutOfBounds,            // strict mode rejected an endpoint
    Busy,                   // another search is in flight on this instance
};

const char* path_status_name(PathStatus status);

struct PathRequest {
    grid::GridPos start;
    grid::GridPos end;
    f32 height_offset = 0;
    u64 request_id = 0;
};

struct PathResult {
    bool success = false;
    PathStatus status = PathStatus::NoPathFound;
    std::vector<Vector3> waypoints; // world space, start -> end; empty on failure
    f64 elapsed_ms = 0;
    u64 request_id = 0;

    // Diagnostics
    std::vector<grid::GridPos> cells;
    f32 total_cost = 0;
    u32 nodes_expanded = 0;
};

} // namespace airpath::path

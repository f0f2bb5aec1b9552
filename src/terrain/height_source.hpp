#pragma once

#include "core/types.hpp"

#include <vector>

namespace airpath::terrain {

/// Placement of a height source's cell grid in world space.
struct SourceGeometry {
    i32 width = 0;
    i32 height = 0;
    f32 cell_size = 1.0f;
    Vector3 origin;
};

/// Elevation provider consumed once at initialization.
/// Implementations describe their own grid and answer per-cell heights;
/// sample_all() produces the whole row-major array in one call.
class HeightSource {
public:
    virtual ~HeightSource() = default;

    virtual f32 cell_size() const = 0;
    virtual Vector3 origin() const = 0;
    virtual i32 grid_width() const = 0;
    virtual i32 grid_height() const = 0;

    /// Height at the centre of cell (x, y). Coordinates are in range.
    virtual f32 height_at(i32 x, i32 y) const = 0;

    /// Row-major [y * width + x] heights for every cell.
    /// With samples_per_dimension > 1 each cell is super-sampled on an n x n
    /// pattern and keeps its highest sample.
    virtual std::vector<f32> sample_all(u32 samples_per_dimension) const;

protected:
    /// Height at an arbitrary world X/Z point. Defaults to the height of the
    /// containing cell, clamped to the grid.
    virtual f32 height_at_world(f32 wx, f32 wz) const;
};

} // namespace airpath::terrain

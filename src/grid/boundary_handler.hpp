#pragma once

#include "core/types.hpp"
#include "grid/grid_config.hpp"
#include "grid/grid_types.hpp"

namespace airpath::grid {

/// Result of a world -> grid or grid -> grid conversion.
/// was_out_of_bounds reports whether the unclamped cell lay outside the grid,
/// regardless of whether clamping was applied.
struct GridConversion {
    GridPos pos;
    bool was_out_of_bounds = false;
};

/// Coordinate transforms between world space (X/Z plane) and grid cells.
///   gridX  = floor((worldX - originX) / cellSize)
///   worldX = originX + (gridX + 0.5) * cellSize   (cell centre)
class BoundaryHandler {
public:
    BoundaryHandler(i32 width, i32 height, f32 cell_size, const Vector3& origin);
    explicit BoundaryHandler(const GridConfiguration& config);

    /// Convert a world position to a cell. With clamp == true the returned
    /// cell is always in range; otherwise it may lie outside the grid.
    /// Non-finite coordinates are always reported out of bounds.
    GridConversion world_to_grid(const Vector3& world, bool clamp) const;

    /// Cell centre in world space; Y is passed through unchanged.
    Vector3 grid_to_world(const GridPos& pos, f32 y) const;

    bool is_valid(const GridPos& pos) const {
        return pos.x >= 0 && pos.y >= 0 && pos.x < width_ && pos.y < height_;
    }

    /// Clamp each axis independently to [0, dimension - 1].
    GridPos clamp(const GridPos& pos) const;

    /// Clamp and report whether clamping changed anything.
    GridConversion clamp_checked(const GridPos& pos) const;

    /// Grid-cell displacement between two cells (Chebyshev: a diagonal
    /// neighbour is one cell away).
    static i32 cell_displacement(const GridPos& a, const GridPos& b);

    i32 width() const { return width_; }
    i32 height() const { return height_; }
    f32 cell_size() const { return cell_size_; }
    const Vector3& origin() const { return origin_; }

private:
    i32 width_;
    i32 height_;
    f32 cell_size_;
    Vector3 origin_;
};

} // namespace airpath::grid

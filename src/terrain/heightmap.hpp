#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <vector>

namespace airpath::terrain {

/// Stores a 16-bit heightmap and provides bilinear-interpolated height queries.
/// Sample dimensions are (map_width + 1) x (map_height + 1) corner points.
/// Local coordinates (0..map_width, 0..map_height) map directly to sample coordinates.
class Heightmap {
public:
    /// Fails with InvalidConfiguration if the map is empty or the raw data
    /// does not hold (map_width + 1) * (map_height + 1) samples.
    static Result<Heightmap> create(u32 map_width, u32 map_height, f32 scale,
                                    std::vector<i16> raw_data);

    /// Bilinear-interpolated height at local position (x, z).
    /// Coordinates are clamped to the valid range.
    f32 get_height(f32 x, f32 z) const;

    /// Raw height at sample position (no interpolation, no bounds check).
    f32 get_height_at_grid(u32 gx, u32 gz) const;

    u32 grid_width() const { return grid_width_; }
    u32 grid_height() const { return grid_height_; }
    u32 map_width() const { return grid_width_ - 1; }
    u32 map_height() const { return grid_height_ - 1; }
    f32 scale() const { return scale_; }

private:
    Heightmap(u32 map_width, u32 map_height, f32 scale,
              std::vector<i16> raw_data);

    u32 grid_width_;   // map_width + 1
    u32 grid_height_;  // map_height + 1
    f32 scale_;        // raw_value * scale = world height
    std::vector<i16> data_; // row-major [gz * grid_width + gx]
};

} // namespace airpath::terrain

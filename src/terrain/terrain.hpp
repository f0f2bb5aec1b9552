#pragma once

#include "terrain/heightmap.hpp"

namespace airpath::terrain {

/// Heightmap plus optional water plane.
/// horizontal_scale is the world distance between two heightmap samples.
class Terrain {
public:
    Terrain(Heightmap heightmap, f32 water_elevation, bool has_water = false,
            f32 horizontal_scale = 1.0f);

    /// Raw terrain height at local world position (can be below water).
    f32 get_terrain_height(f32 x, f32 z) const;

    /// Height an aerial agent must clear: max(terrain, water) when water exists.
    f32 get_surface_height(f32 x, f32 z) const;

    f32 water_elevation() const { return water_elevation_; }
    bool has_water() const { return has_water_; }
    f32 horizontal_scale() const { return horizontal_scale_; }

    const Heightmap& heightmap() const { return heightmap_; }

    /// Local world extent covered by the heightmap.
    f32 world_width() const {
        return static_cast<f32>(heightmap_.map_width()) * horizontal_scale_;
    }
    f32 world_depth() const {
        return static_cast<f32>(heightmap_.map_height()) * horizontal_scale_;
    }

private:
    Heightmap heightmap_;
    f32 water_elevation_;
    bool has_water_;
    f32 horizontal_scale_;
};

} // namespace airpath::terrain

#include "terrain/terrain.hpp"

#include <algorithm>

namespace airpath::terrain {

Terrain::Terrain(Heightmap heightmap, f32 water_elevation, bool has_water,
                 f32 horizontal_scale)
    : heightmap_(std::move(heightmap)),
      water_elevation_(water_elevation),
      has_water_(has_water),
      horizontal_scale_(horizontal_scale > 0.0f ? horizontal_scale : 1.0f) {}

f32 Terrain::get_terrain_height(f32 x, f32 z) const {
    return heightmap_.get_height(x / horizontal_scale_, z / horizontal_scale_);
}

f32 Terrain::get_surface_height(f32 x, f32 z) const {
    const f32 ground = get_terrain_height(x, z);
    return has_water_ ? std::max(ground, water_elevation_) : ground;
}

} // namespace airpath::terrain

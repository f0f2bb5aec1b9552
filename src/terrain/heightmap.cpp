#include "terrain/heightmap.hpp"

#include <algorithm>
#include <cmath>

namespace airpath::terrain {

Heightmap::Heightmap(u32 map_width, u32 map_height, f32 scale,
                     std::vector<i16> raw_data)
    : grid_width_(map_width + 1),
      grid_height_(map_height + 1),
      scale_(scale),
      data_(std::move(raw_data)) {}

Result<Heightmap> Heightmap::create(u32 map_width, u32 map_height, f32 scale,
                                    std::vector<i16> raw_data) {
    if (map_width < 1 || map_height < 1) {
        return Error(ErrorCode::InvalidConfiguration,
                     "heightmap must be at least 1x1");
    }
    const size_t expected =
        static_cast<size_t>(map_width + 1) * (map_height + 1);
    if (raw_data.size() != expected) {
        return Error(ErrorCode::InvalidConfiguration,
                     "heightmap has " + std::to_string(raw_data.size()) +
                         " samples, expected " + std::to_string(expected));
    }
    if (!std::isfinite(scale)) {
        return Error(ErrorCode::InvalidConfiguration,
                     "heightmap scale must be finite");
    }
    return Heightmap(map_width, map_height, scale, std::move(raw_data));
}

f32 Heightmap::get_height_at_grid(u32 gx, u32 gz) const {
    return static_cast<f32>(data_[gz * grid_width_ + gx]) * scale_;
}

f32 Heightmap::get_height(f32 x, f32 z) const {
    // Clamp to valid local range
    f32 max_x = static_cast<f32>(grid_width_ - 1);
    f32 max_z = static_cast<f32>(grid_height_ - 1);
    x = std::clamp(x, 0.0f, max_x);
    z = std::clamp(z, 0.0f, max_z);

    u32 gx = static_cast<u32>(x);
    u32 gz = static_cast<u32>(z);

    // Keep the 2x2 sampling window inside the data
    if (gx >= grid_width_ - 1) gx = grid_width_ - 2;
    if (gz >= grid_height_ - 1) gz = grid_height_ - 2;

    f32 fx = x - static_cast<f32>(gx);
    f32 fz = z - static_cast<f32>(gz);

    f32 h00 = get_height_at_grid(gx, gz);
    f32 h10 = get_height_at_grid(gx + 1, gz);
    f32 h01 = get_height_at_grid(gx, gz + 1);
    f32 h11 = get_height_at_grid(gx + 1, gz + 1);

    f32 h0 = h00 + (h10 - h00) * fx;
    f32 h1 = h01 + (h11 - h01) * fx;
    return h0 + (h1 - h0) * fz;
}

} // namespace airpath::terrain

#include "terrain/height_source.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace airpath::terrain {

std::vector<f32> HeightSource::sample_all(u32 samples_per_dimension) const {
    const i32 w = grid_width();
    const i32 h = grid_height();
    std::vector<f32> out;
    if (w <= 0 || h <= 0) return out;
    out.resize(static_cast<size_t>(w) * static_cast<size_t>(h));

    const u32 n = std::max<u32>(1, samples_per_dimension);
    const f32 cs = cell_size();
    const Vector3 o = origin();

    for (i32 y = 0; y < h; ++y) {
        for (i32 x = 0; x < w; ++x) {
            f32 value;
            if (n == 1) {
                value = height_at(x, y);
            } else {
                value = std::numeric_limits<f32>::lowest();
                const f32 step = cs / static_cast<f32>(n);
                for (u32 sz = 0; sz < n; ++sz) {
                    for (u32 sx = 0; sx < n; ++sx) {
                        f32 wx = o.x + static_cast<f32>(x) * cs +
                                 (static_cast<f32>(sx) + 0.5f) * step;
                        f32 wz = o.z + static_cast<f32>(y) * cs +
                                 (static_cast<f32>(sz) + 0.5f) * step;
                        value = std::max(value, height_at_world(wx, wz));
                    }
                }
            }
            out[static_cast<size_t>(y) * w + x] = value;
        }
    }
    return out;
}

f32 HeightSource::height_at_world(f32 wx, f32 wz) const {
    const f32 cs = cell_size();
    const Vector3 o = origin();
    i32 gx = static_cast<i32>(std::floor((wx - o.x) / cs));
    i32 gy = static_cast<i32>(std::floor((wz - o.z) / cs));
    gx = std::clamp(gx, 0, grid_width() - 1);
    gy = std::clamp(gy, 0, grid_height() - 1);
    return height_at(gx, gy);
}

} // namespace airpath::terrain

#include "terrain/height_sources.hpp"

#include <cassert>
#include <cmath>

namespace airpath::terrain {

namespace {

/// World-space centre of a cell.
void cell_center(const SourceGeometry& g, i32 x, i32 y, f32& wx, f32& wz) {
    wx = g.origin.x + (static_cast<f32>(x) + 0.5f) * g.cell_size;
    wz = g.origin.z + (static_cast<f32>(y) + 0.5f) * g.cell_size;
}

/// Integer lattice hash (lowbias32 finaliser) mapped to [0, 1).
f32 lattice_value(i32 ix, i32 iz, u32 seed) {
    u32 h = static_cast<u32>(ix) * 0x8da6b343u ^ static_cast<u32>(iz) * 0xd8163841u ^
            seed * 0xcb1ab31fu;
    h ^= h >> 16;
    h *= 0x7feb352du;
    h ^= h >> 15;
    h *= 0x846ca68bu;
    h ^= h >> 16;
    return static_cast<f32>(h >> 8) * (1.0f / 16777216.0f);
}

f32 smoothstep(f32 t) { return t * t * (3.0f - 2.0f * t); }

} // namespace

// ----------------------------------------------------------------
// FlatHeightSource
// ----------------------------------------------------------------

FlatHeightSource::FlatHeightSource(const SourceGeometry& geometry, f32 height)
    : geometry_(geometry), height_(height) {}

f32 FlatHeightSource::height_at(i32, i32) const { return height_; }

// ----------------------------------------------------------------
// GridHeightSource
// ----------------------------------------------------------------

GridHeightSource::GridHeightSource(const SourceGeometry& geometry,
                                   std::vector<f32> samples)
    : geometry_(geometry), samples_(std::move(samples)) {}

Result<GridHeightSource> GridHeightSource::create(const SourceGeometry& geometry,
                                                  std::vector<f32> samples) {
    if (geometry.width <= 0 || geometry.height <= 0) {
        return Error(ErrorCode::InvalidConfiguration,
                     "height source dimensions must be positive");
    }
    const size_t expected =
        static_cast<size_t>(geometry.width) * static_cast<size_t>(geometry.height);
    if (samples.size() != expected) {
        return Error(ErrorCode::InvalidConfiguration,
                     "height source has " + std::to_string(samples.size()) +
                         " samples, expected " + std::to_string(expected));
    }
    return GridHeightSource(geometry, std::move(samples));
}

f32 GridHeightSource::height_at(i32 x, i32 y) const {
    assert(x >= 0 && y >= 0 && x < geometry_.width && y < geometry_.height);
    return samples_[static_cast<size_t>(y) * geometry_.width + x];
}

// ----------------------------------------------------------------
// TerrainHeightSource
// ----------------------------------------------------------------

TerrainHeightSource::TerrainHeightSource(const SourceGeometry& geometry,
                                         std::shared_ptr<const Terrain> terrain)
    : geometry_(geometry), terrain_(std::move(terrain)) {
    assert(terrain_);
}

f32 TerrainHeightSource::height_at(i32 x, i32 y) const {
    f32 wx, wz;
    cell_center(geometry_, x, y, wx, wz);
    return height_at_world(wx, wz);
}

f32 TerrainHeightSource::height_at_world(f32 wx, f32 wz) const {
    return terrain_->get_surface_height(wx - geometry_.origin.x,
                                        wz - geometry_.origin.z);
}

// ----------------------------------------------------------------
// ProceduralHeightSource
// ----------------------------------------------------------------

ProceduralHeightSource::ProceduralHeightSource(const SourceGeometry& geometry,
                                               const ProceduralParams& params)
    : geometry_(geometry), params_(params) {
    if (params_.octaves == 0) params_.octaves = 1;
}

f32 ProceduralHeightSource::height_at(i32 x, i32 y) const {
    f32 wx, wz;
    cell_center(geometry_, x, y, wx, wz);
    return height_at_world(wx, wz);
}

f32 ProceduralHeightSource::height_at_world(f32 wx, f32 wz) const {
    f32 sum = 0.0f;
    f32 norm = 0.0f;
    f32 amp = 1.0f;
    f32 freq = params_.frequency;
    for (u32 o = 0; o < params_.octaves; ++o) {
        sum += amp * value_noise(wx * freq, wz * freq, params_.seed + o * 7919u);
        norm += amp;
        amp *= 0.5f;
        freq *= 2.0f;
    }
    return params_.base_height + params_.amplitude * (sum / norm);
}

f32 ProceduralHeightSource::value_noise(f32 x, f32 z, u32 octave_seed) const {
    const f32 fx = std::floor(x);
    const f32 fz = std::floor(z);
    const i32 ix = static_cast<i32>(fx);
    const i32 iz = static_cast<i32>(fz);
    const f32 tx = smoothstep(x - fx);
    const f32 tz = smoothstep(z - fz);

    const f32 v00 = lattice_value(ix, iz, octave_seed);
    const f32 v10 = lattice_value(ix + 1, iz, octave_seed);
    const f32 v01 = lattice_value(ix, iz + 1, octave_seed);
    const f32 v11 = lattice_value(ix + 1, iz + 1, octave_seed);

    const f32 v0 = v00 + (v10 - v00) * tx;
    const f32 v1 = v01 + (v11 - v01) * tx;
    return v0 + (v1 - v0) * tz;
}

} // namespace airpath::terrain

#pragma once

#include "core/result.hpp"
#include "terrain/height_source.hpp"
#include "terrain/terrain.hpp"

#include <memory>
#include <vector>

namespace airpath::terrain {

/// Every cell at the same height.
class FlatHeightSource final : public HeightSource {
public:
    FlatHeightSource(const SourceGeometry& geometry, f32 height = 0.0f);

    f32 cell_size() const override { return geometry_.cell_size; }
    Vector3 origin() const override { return geometry_.origin; }
    i32 grid_width() const override { return geometry_.width; }
    i32 grid_height() const override { return geometry_.height; }
    f32 height_at(i32 x, i32 y) const override;

private:
    SourceGeometry geometry_;
    f32 height_;
};

/// Explicit per-cell samples supplied by the caller (row-major).
class GridHeightSource final : public HeightSource {
public:
    static Result<GridHeightSource> create(const SourceGeometry& geometry,
                                           std::vector<f32> samples);

    f32 cell_size() const override { return geometry_.cell_size; }
    Vector3 origin() const override { return geometry_.origin; }
    i32 grid_width() const override { return geometry_.width; }
    i32 grid_height() const override { return geometry_.height; }
    f32 height_at(i32 x, i32 y) const override;

private:
    GridHeightSource(const SourceGeometry& geometry, std::vector<f32> samples);

    SourceGeometry geometry_;
    std::vector<f32> samples_;
};

/// Static terrain: bilinear heightmap with optional water plane, placed with
/// its local (0, 0) at the geometry origin.
class TerrainHeightSource final : public HeightSource {
public:
    TerrainHeightSource(const SourceGeometry& geometry,
                        std::shared_ptr<const Terrain> terrain);

    f32 cell_size() const override { return geometry_.cell_size; }
    Vector3 origin() const override { return geometry_.origin; }
    i32 grid_width() const override { return geometry_.width; }
    i32 grid_height() const override { return geometry_.height; }
    f32 height_at(i32 x, i32 y) const override;

    const Terrain& terrain() const { return *terrain_; }

protected:
    f32 height_at_world(f32 wx, f32 wz) const override;

private:
    SourceGeometry geometry_;
    std::shared_ptr<const Terrain> terrain_;
};

struct ProceduralParams {
    u32 seed = 1337;
    f32 base_height = 0.0f;
    f32 amplitude = 40.0f;
    f32 frequency = 0.02f; // lattice cells per world unit
    u32 octaves = 4;
};

/// Seeded fractal value noise: base_height + amplitude * noise, noise in [0, 1].
class ProceduralHeightSource final : public HeightSource {
public:
    ProceduralHeightSource(const SourceGeometry& geometry,
                           const ProceduralParams& params);

    f32 cell_size() const override { return geometry_.cell_size; }
    Vector3 origin() const override { return geometry_.origin; }
    i32 grid_width() const override { return geometry_.width; }
    i32 grid_height() const override { return geometry_.height; }
    f32 height_at(i32 x, i32 y) const override;

    const ProceduralParams& params() const { return params_; }

protected:
    f32 height_at_world(f32 wx, f32 wz) const override;

private:
    f32 value_noise(f32 x, f32 z, u32 octave_seed) const;

    SourceGeometry geometry_;
    ProceduralParams params_;
};

} // namespace airpath::terrain

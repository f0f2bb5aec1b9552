#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "grid/grid_config.hpp"
#include "grid/grid_types.hpp"

#include <cassert>
#include <vector>

namespace airpath::grid {

/// Dense row-major elevation samples, one per cell ([y * width + x]).
/// Immutable once built; re-sampling builds a new grid and replaces the old one.
class ElevationGrid {
public:
    /// Take ownership of samples. Fails with InvalidConfiguration if the sample
    /// count does not match the configuration or any sample is non-finite.
    static Result<ElevationGrid> create(const GridConfiguration& config,
                                        std::vector<f32> samples);

    const GridConfiguration& config() const { return config_; }
    i32 width() const { return config_.width(); }
    i32 height() const { return config_.height(); }
    u32 cell_count() const { return config_.cell_count(); }

    /// Elevation of an in-range cell. Callers clamp first.
    f32 elevation_at(i32 x, i32 y) const {
        assert(x >= 0 && y >= 0 && x < width() && y < height());
        return samples_[index_of(x, y)];
    }

    f32 elevation_at_index(u32 idx) const {
        assert(idx < samples_.size());
        return samples_[idx];
    }

    u32 index_of(i32 x, i32 y) const {
        return static_cast<u32>(y) * static_cast<u32>(width()) +
               static_cast<u32>(x);
    }

    GridPos position_of(u32 idx) const {
        const u32 w = static_cast<u32>(width());
        return {static_cast<i32>(idx % w), static_cast<i32>(idx / w)};
    }

    f32 min_elevation() const { return min_elevation_; }
    f32 max_elevation() const { return max_elevation_; }

    const std::vector<f32>& samples() const { return samples_; }

private:
    ElevationGrid(const GridConfiguration& config, std::vector<f32> samples);

    GridConfiguration config_;
    std::vector<f32> samples_;
    f32 min_elevation_ = 0;
    f32 max_elevation_ = 0;
};

} // namespace airpath::grid

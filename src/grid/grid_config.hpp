#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

namespace airpath::grid {

/// Immutable grid geometry and cost settings.
/// Only obtainable through create(), so every instance is valid.
class GridConfiguration {
public:
    static constexpr u32 DEFAULT_MAX_ITERATIONS = 50000;

    /// Validate and build a configuration.
    /// Fails with InvalidConfiguration on non-positive dimensions or cell size,
    /// a negative or non-finite cost multiplier, or zero sampling/iteration limits.
    static Result<GridConfiguration> create(i32 width, i32 height, f32 cell_size,
                                            const Vector3& origin,
                                            f32 cost_multiplier,
                                            u32 samples_per_cell = 1,
                                            u32 max_iterations = DEFAULT_MAX_ITERATIONS);

    i32 width() const { return width_; }
    i32 height() const { return height_; }
    f32 cell_size() const { return cell_size_; }
    const Vector3& origin() const { return origin_; }
    f32 cost_multiplier() const { return cost_multiplier_; }
    u32 samples_per_cell() const { return samples_per_cell_; }
    u32 max_iterations() const { return max_iterations_; }

    u32 cell_count() const {
        return static_cast<u32>(width_) * static_cast<u32>(height_);
    }

    /// World-space extent covered by the grid on X and Z.
    f32 world_width() const { return static_cast<f32>(width_) * cell_size_; }
    f32 world_depth() const { return static_cast<f32>(height_) * cell_size_; }

private:
    GridConfiguration() = default;

    i32 width_ = 0;
    i32 height_ = 0;
    f32 cell_size_ = 0;
    Vector3 origin_;
    f32 cost_multiplier_ = 0;
    u32 samples_per_cell_ = 1;
    u32 max_iterations_ = DEFAULT_MAX_ITERATIONS;
};

} // namespace airpath::grid

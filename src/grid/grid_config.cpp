#include "grid/grid_config.hpp"

#include <cmath>
#include <limits>
#include <spdlog/spdlog.h>

namespace airpath::grid {

// Largest cell count the u32 node indices can address.
static constexpr u64 MAX_CELLS = std::numeric_limits<u32>::max() - 1;

Result<GridConfiguration> GridConfiguration::create(i32 width, i32 height,
                                                    f32 cell_size,
                                                    const Vector3& origin,
                                                    f32 cost_multiplier,
                                                    u32 samples_per_cell,
                                                    u32 max_iterations) {
    auto reject = [](std::string msg) -> Error {
        spdlog::warn("GridConfiguration rejected: {}", msg);
        return Error(ErrorCode::InvalidConfiguration, std::move(msg));
    };

    if (width <= 0 || height <= 0) {
        return reject("grid dimensions must be positive, got " +
                      std::to_string(width) + "x" + std::to_string(height));
    }
    if (static_cast<u64>(width) * static_cast<u64>(height) > MAX_CELLS) {
        return reject("grid of " + std::to_string(width) + "x" +
                      std::to_string(height) + " cells is too large");
    }
    if (!std::isfinite(cell_size) || cell_size <= 0.0f) {
        return reject("cell size must be positive, got " +
                      std::to_string(cell_size));
    }
    if (!std::isfinite(cost_multiplier) || cost_multiplier < 0.0f) {
        return reject("cost multiplier must be >= 0, got " +
                      std::to_string(cost_multiplier));
    }
    if (!std::isfinite(origin.x) || !std::isfinite(origin.y) ||
        !std::isfinite(origin.z)) {
        return reject("origin must be finite");
    }
    if (samples_per_cell == 0) {
        return reject("samples per cell must be at least 1");
    }
    if (max_iterations == 0) {
        return reject("max iterations must be at least 1");
    }

    GridConfiguration config;
    config.width_ = width;
    config.height_ = height;
    config.cell_size_ = cell_size;
    config.origin_ = origin;
    config.cost_multiplier_ = cost_multiplier;
    config.samples_per_cell_ = samples_per_cell;
    config.max_iterations_ = max_iterations;
    return config;
}

} // namespace airpath::grid

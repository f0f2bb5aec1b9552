#include "grid/elevation_grid.hpp"

#include <algorithm>
#include <cmath>

namespace airpath::grid {

ElevationGrid::ElevationGrid(const GridConfiguration& config,
                             std::vector<f32> samples)
    : config_(config), samples_(std::move(samples)) {
    auto [lo, hi] = std::minmax_element(samples_.begin(), samples_.end());
    min_elevation_ = *lo;
    max_elevation_ = *hi;
}

Result<ElevationGrid> ElevationGrid::create(const GridConfiguration& config,
                                            std::vector<f32> samples) {
    if (samples.size() != config.cell_count()) {
        return Error(ErrorCode::InvalidConfiguration,
                     "elevation sample count " + std::to_string(samples.size()) +
                         " does not match grid of " +
                         std::to_string(config.cell_count()) + " cells");
    }
    for (size_t i = 0; i < samples.size(); ++i) {
        if (!std::isfinite(samples[i])) {
            return Error(ErrorCode::InvalidConfiguration,
                         "elevation sample " + std::to_string(i) +
                             " is not finite");
        }
    }
    return ElevationGrid(config, std::move(samples));
}

} // namespace airpath::grid

#include "grid/boundary_handler.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace airpath::grid {

namespace {

/// floor() of a world-relative coordinate, saturated into i32 range.
/// NaN maps to the lowest value so it can never look like a valid cell.
i32 to_cell(f64 world, f64 origin, f64 cell_size) {
    const f64 v = std::floor((world - origin) / cell_size);
    constexpr f64 lo = static_cast<f64>(std::numeric_limits<i32>::min());
    constexpr f64 hi = static_cast<f64>(std::numeric_limits<i32>::max());
    if (std::isnan(v) || v <= lo) return std::numeric_limits<i32>::min();
    if (v >= hi) return std::numeric_limits<i32>::max();
    return static_cast<i32>(v);
}

} // namespace

BoundaryHandler::BoundaryHandler(i32 width, i32 height, f32 cell_size,
                                 const Vector3& origin)
    : width_(width), height_(height), cell_size_(cell_size), origin_(origin) {}

BoundaryHandler::BoundaryHandler(const GridConfiguration& config)
    : BoundaryHandler(config.width(), config.height(), config.cell_size(),
                      config.origin()) {}

GridConversion BoundaryHandler::world_to_grid(const Vector3& world,
                                              bool clamp) const {
    GridConversion out;
    out.pos.x = to_cell(world.x, origin_.x, cell_size_);
    out.pos.y = to_cell(world.z, origin_.z, cell_size_);
    out.was_out_of_bounds = !is_valid(out.pos);
    if (clamp && out.was_out_of_bounds) {
        out.pos = this->clamp(out.pos);
    }
    return out;
}

Vector3 BoundaryHandler::grid_to_world(const GridPos& pos, f32 y) const {
    Vector3 w;
    w.x = origin_.x + (static_cast<f32>(pos.x) + 0.5f) * cell_size_;
    w.y = y;
    w.z = origin_.z + (static_cast<f32>(pos.y) + 0.5f) * cell_size_;
    return w;
}

GridPos BoundaryHandler::clamp(const GridPos& pos) const {
    return {std::clamp(pos.x, 0, width_ - 1), std::clamp(pos.y, 0, height_ - 1)};
}

GridConversion BoundaryHandler::clamp_checked(const GridPos& pos) const {
    GridConversion out;
    out.was_out_of_bounds = !is_valid(pos);
    out.pos = out.was_out_of_bounds ? clamp(pos) : pos;
    return out;
}

i32 BoundaryHandler::cell_displacement(const GridPos& a, const GridPos& b) {
    const i64 dx = std::llabs(static_cast<i64>(a.x) - b.x);
    const i64 dy = std::llabs(static_cast<i64>(a.y) - b.y);
    const i64 d = std::max(dx, dy);
    return d > std::numeric_limits<i32>::max() ? std::numeric_limits<i32>::max()
                                               : static_cast<i32>(d);
}

} // namespace airpath::grid

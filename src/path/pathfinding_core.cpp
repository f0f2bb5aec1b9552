#include "path/pathfinding_core.hpp"
#include "terrain/height_source.hpp"

#include <chrono>
#include <cmath>
#include <future>
#include <spdlog/spdlog.h>
#include <system_error>

namespace airpath::path {

namespace {

/// Holds the single in-flight slot for the lifetime of a call.
class InFlightGuard {
public:
    explicit InFlightGuard(std::atomic<bool>& flag)
        : flag_(flag), acquired_(!flag.exchange(true)) {}
    ~InFlightGuard() {
        if (acquired_) flag_.store(false);
    }
    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

    bool acquired() const { return acquired_; }

private:
    std::atomic<bool>& flag_;
    bool acquired_;
};

} // namespace

PathfindingCore::PathfindingCore(const SearchSettings& settings,
                                 const ThrottleSettings& tracking)
    : throttle_(tracking), settings_(settings) {}

Result<void> PathfindingCore::initialize(const grid::GridConfiguration& config,
                                         const terrain::HeightSource& source) {
    InFlightGuard guard(in_flight_);
    if (!guard.acquired()) {
        return Error(ErrorCode::Busy,
                     "cannot re-initialize while a search is in flight");
    }

    if (source.grid_width() != config.width() ||
        source.grid_height() != config.height()) {
        spdlog::warn("PathfindingCore: height source is {}x{}, configuration is {}x{}",
                     source.grid_width(), source.grid_height(),
                     config.width(), config.height());
        return Error(ErrorCode::InvalidConfiguration,
                     "height source dimensions do not match the grid configuration");
    }
    const Vector3 so = source.origin();
    const f32 tol = config.cell_size() * 1e-4f;
    if (std::fabs(source.cell_size() - config.cell_size()) > tol ||
        std::fabs(so.x - config.origin().x) > tol ||
        std::fabs(so.z - config.origin().z) > tol) {
        spdlog::warn("PathfindingCore: height source placement does not match "
                     "the grid configuration");
        return Error(ErrorCode::InvalidConfiguration,
                     "height source cell size or origin does not match the grid configuration");
    }

    auto sampled = grid::ElevationGrid::create(
        config, source.sample_all(config.samples_per_cell()));
    if (!sampled.ok()) {
        spdlog::warn("PathfindingCore: {}", sampled.error().message);
        return sampled.error();
    }

    grid_ = std::move(sampled.value());
    boundary_.emplace(config);
    engine_.prepare(config.cell_count());
    throttle_.reset();

    spdlog::info("PathfindingCore: grid {}x{} cell={} multiplier={} "
                 "elevation=[{}, {}]",
                 config.width(), config.height(), config.cell_size(),
                 config.cost_multiplier(), grid_->min_elevation(),
                 grid_->max_elevation());
    return {};
}

bool PathfindingCore::resolve_endpoint(grid::GridPos& pos, Violations& violations) {
    if (boundary_->is_valid(pos)) return true;

    BoundaryViolationEvent ev;
    ev.original = pos;
    ev.clamped = boundary_->clamp(pos);
    ev.auto_clamped = settings_.clamp_out_of_bounds;

    spdlog::warn("PathfindingCore: cell ({}, {}) outside {}x{} grid, {}",
                 pos.x, pos.y, boundary_->width(), boundary_->height(),
                 ev.auto_clamped ? "clamped" : "rejected");
    violations.push_back(ev);

    if (!settings_.clamp_out_of_bounds) return false;
    pos = ev.clamped;
    return true;
}

PathResult PathfindingCore::calculate_path(const grid::GridPos& start,
                                           const grid::GridPos& end,
                                           f32 height_offset) {
    const u64 id = next_request_id_.fetch_add(1);
    Violations violations;
    PathResult result;
    {
        InFlightGuard guard(in_flight_);
        if (!guard.acquired()) {
            result = busy(id);
        } else {
            result = calculate_locked(start, end, height_offset, id, violations);
        }
    }
    return finish(std::move(result), violations);
}

PathResult PathfindingCore::calculate_path(const Vector3& start,
                                           const Vector3& end,
                                           f32 height_offset) {
    const u64 id = next_request_id_.fetch_add(1);
    Violations violations;
    PathResult result;
    {
        InFlightGuard guard(in_flight_);
        if (!guard.acquired()) {
            result = busy(id);
        } else if (!boundary_) {
            result = failure(PathStatus::Uninitialized, id);
        } else {
            // Unclamped here; calculate_locked applies the clamping policy.
            const auto s = boundary_->world_to_grid(start, false);
            const auto e = boundary_->world_to_grid(end, false);
            result = calculate_locked(s.pos, e.pos, height_offset, id, violations);
        }
    }
    return finish(std::move(result), violations);
}

PathResult PathfindingCore::calculate_locked(const grid::GridPos& start,
                                             const grid::GridPos& end,
                                             f32 height_offset, u64 request_id,
                                             Violations& violations) {
    if (!grid_) return failure(PathStatus::Uninitialized, request_id);

    const auto t0 = std::chrono::steady_clock::now();

    PathRequest request;
    request.start = start;
    request.end = end;
    request.height_offset = height_offset;
    request.request_id = request_id;

    PathResult result;
    if (!resolve_endpoint(request.start, violations) ||
        !resolve_endpoint(request.end, violations)) {
        result = failure(PathStatus::OutOfBounds, request_id);
    } else {
        result = run(request);
    }

    const auto t1 = std::chrono::steady_clock::now();
    result.elapsed_ms =
        std::chrono::duration<f64, std::milli>(t1 - t0).count();
    return result;
}

SearchEngine::Outcome PathfindingCore::execute(const PathRequest& request) {
    if (settings_.run_on_worker) {
        try {
            auto task = std::async(std::launch::async, [this, &request] {
                return engine_.search(*grid_, request.start, request.end);
            });
            return task.get();
        } catch (const std::system_error& e) {
            spdlog::warn("PathfindingCore: worker unavailable ({}), searching inline",
                         e.what());
        }
    }
    return engine_.search(*grid_, request.start, request.end);
}

PathResult PathfindingCore::run(const PathRequest& request) {
    SearchEngine::Outcome outcome = execute(request);

    PathResult result;
    result.request_id = request.request_id;
    result.status = outcome.status;
    result.success = outcome.status == PathStatus::Success;
    result.nodes_expanded = outcome.nodes_expanded;

    if (!result.success) return result;

    result.total_cost = outcome.total_cost;
    result.cells.reserve(outcome.cells.size());
    result.waypoints.reserve(outcome.cells.size());
    for (u32 idx : outcome.cells) {
        const grid::GridPos p = grid_->position_of(idx);
        result.cells.push_back(p);
        result.waypoints.push_back(boundary_->grid_to_world(
            p, grid_->elevation_at_index(idx) + request.height_offset));
    }
    return result;
}

PathResult PathfindingCore::failure(PathStatus status, u64 request_id) {
    PathResult result;
    result.success = false;
    result.status = status;
    result.request_id = request_id;
    return result;
}

PathResult PathfindingCore::busy(u64 request_id) {
    spdlog::warn("PathfindingCore: request {} rejected, search in flight", request_id);
    return failure(PathStatus::Busy, request_id);
}

PathResult PathfindingCore::finish(PathResult result, const Violations& violations) {
    if (events_.on_boundary_violation) {
        for (const auto& ev : violations) events_.on_boundary_violation(ev);
    }
    if (result.success) {
        spdlog::debug("PathfindingCore: request {} found {} waypoints, cost {:.3f}, "
                      "{} nodes, {:.3f} ms",
                      result.request_id, result.waypoints.size(),
                      result.total_cost, result.nodes_expanded, result.elapsed_ms);
    } else {
        spdlog::debug("PathfindingCore: request {} failed ({}) after {} nodes",
                      result.request_id, path_status_name(result.status),
                      result.nodes_expanded);
    }
    if (events_.on_path_calculated) events_.on_path_calculated(result);
    return result;
}

Result<grid::GridConversion> PathfindingCore::world_to_grid(const Vector3& pos,
                                                            bool clamp) const {
    if (!boundary_) {
        return Error(ErrorCode::Uninitialized, "pathfinding core is not initialized");
    }
    return boundary_->world_to_grid(pos, clamp);
}

Result<Vector3> PathfindingCore::grid_to_world(const grid::GridPos& pos,
                                               f32 y_offset) const {
    if (!grid_) {
        return Error(ErrorCode::Uninitialized, "pathfinding core is not initialized");
    }
    const grid::GridPos c = boundary_->clamp(pos);
    return boundary_->grid_to_world(pos, grid_->elevation_at(c.x, c.y) + y_offset);
}

bool PathfindingCore::is_valid_grid_position(const grid::GridPos& pos) const {
    return boundary_ && boundary_->is_valid(pos);
}

Result<grid::GridPos> PathfindingCore::clamp_to_valid_grid_position(
    const grid::GridPos& pos) const {
    if (!boundary_) {
        return Error(ErrorCode::Uninitialized, "pathfinding core is not initialized");
    }
    return boundary_->clamp(pos);
}

bool PathfindingCore::should_recalculate(f64 now, const grid::GridPos& target,
                                         const grid::GridPos& origin,
                                         f32 distance_to_target) {
    return throttle_.should_recalculate(now, target, origin, distance_to_target);
}

} // namespace airpath::path

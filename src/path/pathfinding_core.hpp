#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "grid/boundary_handler.hpp"
#include "grid/elevation_grid.hpp"
#include "grid/grid_config.hpp"
#include "path/path_events.hpp"
#include "path/path_types.hpp"
#include "path/recalculation_throttle.hpp"
#include "path/search_engine.hpp"

#include <atomic>
#include <optional>
#include <vector>

namespace airpath::terrain {
class HeightSource;
}

namespace airpath::path {

struct SearchSettings {
    /// Clamp out-of-range endpoints (and report them) instead of failing.
    bool clamp_out_of_bounds = true;
    /// Run each search on a worker thread; the call still blocks until done.
    bool run_on_worker = false;
};

/// Public entry point: owns the elevation grid, the search working buffers
/// and the tracking throttle for one agent group.
///
/// At most one search runs per instance; a second concurrent call returns
/// PathStatus::Busy. Independent instances share nothing. Event callbacks run
/// after the search slot is released, so they may issue new requests.
class PathfindingCore {
public:
    explicit PathfindingCore(const SearchSettings& settings = {},
                             const ThrottleSettings& tracking = {});

    PathfindingCore(const PathfindingCore&) = delete;
    PathfindingCore& operator=(const PathfindingCore&) = delete;

    /// Sample the height source and size working memory for the grid.
    /// The source's grid must match the configuration. May be called again
    /// to replace the grid, but never while a search is running.
    Result<void> initialize(const grid::GridConfiguration& config,
                            const terrain::HeightSource& source);

    bool is_initialized() const { return grid_.has_value(); }

    PathResult calculate_path(const grid::GridPos& start,
                              const grid::GridPos& end, f32 height_offset);

    /// World-space overload; endpoints go through world_to_grid with the
    /// configured clamping policy.
    PathResult calculate_path(const Vector3& start, const Vector3& end,
                              f32 height_offset);

    Result<grid::GridConversion> world_to_grid(const Vector3& pos,
                                               bool clamp) const;

    /// Cell centre; Y is the cell's elevation plus y_offset.
    Result<Vector3> grid_to_world(const grid::GridPos& pos, f32 y_offset) const;

    bool is_valid_grid_position(const grid::GridPos& pos) const;
    Result<grid::GridPos> clamp_to_valid_grid_position(const grid::GridPos& pos) const;

    /// Continuous tracking: ask the throttle whether to search again.
    bool should_recalculate(f64 now, const grid::GridPos& target,
                            const grid::GridPos& origin, f32 distance_to_target);

    RecalculationThrottle& throttle() { return throttle_; }
    const RecalculationThrottle& throttle() const { return throttle_; }

    void set_events(PathEvents events) { events_ = std::move(events); }

    const SearchSettings& search_settings() const { return settings_; }
    void set_search_settings(const SearchSettings& settings) { settings_ = settings; }

    const grid::ElevationGrid* elevation_grid() const {
        return grid_ ? &*grid_ : nullptr;
    }
    const grid::BoundaryHandler* boundary() const {
        return boundary_ ? &*boundary_ : nullptr;
    }

    bool search_in_flight() const { return in_flight_.load(); }

private:
    using Violations = std::vector<BoundaryViolationEvent>;

    /// Apply the clamping policy to one endpoint. Returns false if the
    /// endpoint is out of range and strict mode rejects it.
    bool resolve_endpoint(grid::GridPos& pos, Violations& violations);

    /// Body of calculate_path; caller holds the search slot.
    PathResult calculate_locked(const grid::GridPos& start,
                                const grid::GridPos& end, f32 height_offset,
                                u64 request_id, Violations& violations);

    PathResult run(const PathRequest& request);
    SearchEngine::Outcome execute(const PathRequest& request);
    /// Log and deliver events. Called with the search slot released.
    PathResult finish(PathResult result, const Violations& violations = {});
    PathResult failure(PathStatus status, u64 request_id);
    PathResult busy(u64 request_id);

    std::optional<grid::ElevationGrid> grid_;
    std::optional<grid::BoundaryHandler> boundary_;
    SearchEngine engine_;
    RecalculationThrottle throttle_;
    PathEvents events_;
    SearchSettings settings_;

    std::atomic<bool> in_flight_{false};
    std::atomic<u64> next_request_id_{1};
};

} // namespace airpath::path

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "grid/grid_config.hpp"
#include "path/pathfinding_core.hpp"
#include "path/recalculation_throttle.hpp"
#include "terrain/height_sources.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace airpath::lua {

class LuaState;

/// Inline 16-bit heightmap: (map_width + 1) * (map_height + 1) row-major
/// samples, raw * height_scale = world height.
struct HeightmapSettings {
    u32 map_width = 0;
    u32 map_height = 0;
    f32 height_scale = 1.0f;
    f32 horizontal_scale = 1.0f;
    f32 water_elevation = 0.0f;
    bool has_water = false;
    std::vector<i16> samples;
};

struct TerrainSettings {
    std::string source = "flat"; ///< "flat", "procedural" or "heightmap"
    f32 height = 0.0f;           ///< flat height / procedural base height
    terrain::ProceduralParams procedural;
    HeightmapSettings heightmap;
};

struct AirPathConfig {
    grid::GridConfiguration grid;
    path::SearchSettings search;
    f32 height_offset = 10.0f;
    path::ThrottleSettings tracking;
    TerrainSettings terrain;
};

/// Reads the global `AirPath` table defined by a configuration script.
///
///   AirPath = {
///       Grid = { Width, Height, CellSize, Origin = {x, y, z},
///                CostMultiplier, SamplesPerCell, MaxIterations },
///       Search = { HeightOffset, ClampOutOfBounds, RunOnWorker },
///       Tracking = { MinInterval, TargetThreshold, OriginThreshold,
///                    DistanceThrottling, DistanceStart, DistanceRange,
///                    MaxIntervalMultiplier },
///       Terrain = { Source, Height, Seed, Amplitude, Frequency, Octaves,
///                   MapWidth, MapHeight, HeightScale, HorizontalScale,
///                   WaterElevation, HasWater, Samples = { ... } },
///   }
///
/// Omitted keys keep their defaults. Scripts may call LOG/WARN/SPEW/ALERT.
class ConfigLoader {
public:
    static Result<AirPathConfig> load_file(const fs::path& path);
    static Result<AirPathConfig> load_string(std::string_view code);

    /// Configuration with every key at its default.
    static AirPathConfig defaults();

private:
    static Result<AirPathConfig> read(LuaState& state);
};

/// Build the height source a configuration asks for, placed on its grid.
Result<std::unique_ptr<terrain::HeightSource>> make_height_source(
    const AirPathConfig& config);

/// Pathfinding core with the configured search and tracking settings.
/// Still needs initialize() with the grid and a height source.
std::unique_ptr<path::PathfindingCore> make_pathfinding_core(
    const AirPathConfig& config);

} // namespace airpath::lua

#include "lua/config_loader.hpp"
#include "core/log.hpp"
#include "lua/lua_state.hpp"

#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace airpath::lua {

namespace {

/// Typed field access on the Lua table at an absolute stack index.
/// The first type error is kept; later reads become no-ops.
class FieldReader {
public:
    FieldReader(lua_State* L, int table, std::string scope)
        : L_(L), table_(table), scope_(std::move(scope)) {}

    void number(const char* key, f64& out) {
        if (!push(key)) return;
        if (lua_type(L_, -1) != LUA_TNUMBER) {
            fail(key, "a number");
        } else {
            f64 v = lua_tonumber(L_, -1);
            if (!std::isfinite(v)) fail(key, "a finite number");
            else out = v;
        }
        lua_pop(L_, 1);
    }

    void number(const char* key, f32& out) {
        f64 v = out;
        number(key, v);
        if (error_) return;
        const f32 narrowed = static_cast<f32>(v);
        if (!std::isfinite(narrowed)) {
            error_ = Error(ErrorCode::ScriptError,
                           scope_ + "." + key + " is out of range for a float");
            return;
        }
        out = narrowed;
    }

    template <typename Int>
    void integer(const char* key, Int& out) {
        f64 v = static_cast<f64>(out);
        number(key, v);
        if (error_) return;
        if (std::floor(v) != v ||
            v < static_cast<f64>(std::numeric_limits<Int>::min()) ||
            v > static_cast<f64>(std::numeric_limits<Int>::max())) {
            error_ = Error(ErrorCode::ScriptError,
                           scope_ + "." + key + " must be an integer in range");
            return;
        }
        out = static_cast<Int>(v);
    }

    void boolean(const char* key, bool& out) {
        if (!push(key)) return;
        if (lua_type(L_, -1) != LUA_TBOOLEAN) fail(key, "a boolean");
        else out = lua_toboolean(L_, -1) != 0;
        lua_pop(L_, 1);
    }

    void string(const char* key, std::string& out) {
        if (!push(key)) return;
        if (lua_type(L_, -1) != LUA_TSTRING) fail(key, "a string");
        else out = lua_tostring(L_, -1);
        lua_pop(L_, 1);
    }

    /// Origin = {x, y, z} or {x = .., y = .., z = ..}
    void vector3(const char* key, Vector3& out) {
        if (!push(key)) return;
        const int t = lua_gettop(L_);
        if (lua_type(L_, t) != LUA_TTABLE) {
            fail(key, "a table");
            lua_pop(L_, 1);
            return;
        }
        f32* comps[3] = {&out.x, &out.y, &out.z};
        const char* names[3] = {"x", "y", "z"};
        for (int i = 0; i < 3 && !error_; ++i) {
            lua_rawgeti(L_, t, i + 1);
            if (lua_isnil(L_, -1)) {
                lua_pop(L_, 1);
                lua_pushstring(L_, names[i]);
                lua_gettable(L_, t);
            }
            if (lua_type(L_, -1) == LUA_TNUMBER) {
                *comps[i] = static_cast<f32>(lua_tonumber(L_, -1));
            } else if (!lua_isnil(L_, -1)) {
                fail(key, "a table of numbers");
            }
            lua_pop(L_, 1);
        }
        lua_pop(L_, 1);
    }

    /// Samples = { 0, 12, 40, ... }, every entry an integer of type Int.
    template <typename Int>
    void integer_array(const char* key, std::vector<Int>& out) {
        if (!push(key)) return;
        const int t = lua_gettop(L_);
        if (lua_type(L_, t) != LUA_TTABLE) {
            fail(key, "a table");
            lua_pop(L_, 1);
            return;
        }
        std::vector<Int> values;
        for (int i = 1;; ++i) {
            lua_rawgeti(L_, t, i);
            if (lua_isnil(L_, -1)) {
                lua_pop(L_, 1);
                break;
            }
            const f64 v = lua_type(L_, -1) == LUA_TNUMBER ? lua_tonumber(L_, -1) : 0.5;
            lua_pop(L_, 1);
            if (std::floor(v) != v ||
                v < static_cast<f64>(std::numeric_limits<Int>::min()) ||
                v > static_cast<f64>(std::numeric_limits<Int>::max())) {
                error_ = Error(ErrorCode::ScriptError,
                               scope_ + "." + key + "[" + std::to_string(i) +
                                   "] must be an integer in range");
                break;
            }
            values.push_back(static_cast<Int>(v));
        }
        lua_pop(L_, 1);
        if (!error_) out = std::move(values);
    }

    const std::optional<Error>& error() const { return error_; }

private:
    /// Push table[key]; returns false (and pushes nothing) if absent.
    bool push(const char* key) {
        if (error_) return false;
        lua_pushstring(L_, key);
        lua_gettable(L_, table_);
        if (lua_isnil(L_, -1)) {
            lua_pop(L_, 1);
            return false;
        }
        return true;
    }

    void fail(const char* key, const char* expected) {
        error_ = Error(ErrorCode::ScriptError,
                       scope_ + "." + key + " must be " + expected + ", got " +
                           lua_typename(L_, lua_type(L_, -1)));
    }

    lua_State* L_;
    int table_;
    std::string scope_;
    std::optional<Error> error_;
};

/// Push AirPath[name] if it is a table. Returns its stack index or 0.
int push_section(lua_State* L, int root, const char* name,
                 std::optional<Error>& error) {
    lua_pushstring(L, name);
    lua_gettable(L, root);
    if (lua_isnil(L, -1)) {
        lua_pop(L, 1);
        return 0;
    }
    if (!lua_istable(L, -1)) {
        error = Error(ErrorCode::ScriptError,
                      std::string("AirPath.") + name + " must be a table");
        lua_pop(L, 1);
        return 0;
    }
    return lua_gettop(L);
}

/// State with the script logging bridge installed.
LuaState make_state() {
    LuaState state;
    state.register_function("LOG", log::l_LOG);
    state.register_function("WARN", log::l_WARN);
    state.register_function("SPEW", log::l_SPEW);
    state.register_function("ALERT", log::l_ALERT);
    return state;
}

} // namespace

AirPathConfig ConfigLoader::defaults() {
    auto grid = grid::GridConfiguration::create(64, 64, 2.0f, Vector3{}, 1.0f);
    return AirPathConfig{grid.value(), {}, 10.0f, {}, {}};
}

Result<AirPathConfig> ConfigLoader::load_file(const fs::path& path) {
    LuaState state = make_state();

    auto run = state.do_file(path);
    if (!run.ok()) {
        spdlog::warn("Config: {}", run.error().message);
        return Error(ErrorCode::ScriptError, run.error().message);
    }
    spdlog::info("Config: loaded {}", path.string());
    return read(state);
}

Result<AirPathConfig> ConfigLoader::load_string(std::string_view code) {
    LuaState state = make_state();

    auto run = state.do_string(code);
    if (!run.ok()) {
        spdlog::warn("Config: {}", run.error().message);
        return Error(ErrorCode::ScriptError, run.error().message);
    }
    return read(state);
}

Result<AirPathConfig> ConfigLoader::read(LuaState& state) {
    lua_State* L = state.raw();
    if (!L) return Error(ErrorCode::ScriptError, "Lua state is not available");

    lua_getglobal(L, "AirPath");
    if (!lua_istable(L, -1)) {
        lua_pop(L, 1);
        return Error(ErrorCode::ScriptError,
                     "configuration script must define an AirPath table");
    }
    const int root = lua_gettop(L);

    i32 width = 64;
    i32 height = 64;
    f32 cell_size = 2.0f;
    Vector3 origin;
    f32 cost_multiplier = 1.0f;
    u32 samples_per_cell = 1;
    u32 max_iterations = grid::GridConfiguration::DEFAULT_MAX_ITERATIONS;

    path::SearchSettings search;
    f32 height_offset = 10.0f;
    path::ThrottleSettings tracking;
    TerrainSettings terrain;

    std::optional<Error> error;

    if (int t = push_section(L, root, "Grid", error)) {
        FieldReader r(L, t, "AirPath.Grid");
        r.integer("Width", width);
        r.integer("Height", height);
        r.number("CellSize", cell_size);
        r.vector3("Origin", origin);
        r.number("CostMultiplier", cost_multiplier);
        r.integer("SamplesPerCell", samples_per_cell);
        r.integer("MaxIterations", max_iterations);
        if (r.error()) error = r.error();
        lua_pop(L, 1);
    }

    if (int t = !error ? push_section(L, root, "Search", error) : 0) {
        FieldReader r(L, t, "AirPath.Search");
        r.number("HeightOffset", height_offset);
        r.boolean("ClampOutOfBounds", search.clamp_out_of_bounds);
        r.boolean("RunOnWorker", search.run_on_worker);
        if (r.error()) error = r.error();
        lua_pop(L, 1);
    }

    if (int t = !error ? push_section(L, root, "Tracking", error) : 0) {
        FieldReader r(L, t, "AirPath.Tracking");
        r.number("MinInterval", tracking.min_interval);
        r.integer("TargetThreshold", tracking.target_threshold);
        r.integer("OriginThreshold", tracking.origin_threshold);
        r.boolean("DistanceThrottling", tracking.distance_throttling);
        r.number("DistanceStart", tracking.distance_start);
        r.number("DistanceRange", tracking.distance_range);
        r.number("MaxIntervalMultiplier", tracking.max_interval_multiplier);
        if (r.error()) error = r.error();
        lua_pop(L, 1);
    }

    if (int t = !error ? push_section(L, root, "Terrain", error) : 0) {
        FieldReader r(L, t, "AirPath.Terrain");
        r.string("Source", terrain.source);
        r.number("Height", terrain.height);
        r.integer("Seed", terrain.procedural.seed);
        r.number("Amplitude", terrain.procedural.amplitude);
        r.number("Frequency", terrain.procedural.frequency);
        r.integer("Octaves", terrain.procedural.octaves);
        r.integer("MapWidth", terrain.heightmap.map_width);
        r.integer("MapHeight", terrain.heightmap.map_height);
        r.number("HeightScale", terrain.heightmap.height_scale);
        r.number("HorizontalScale", terrain.heightmap.horizontal_scale);
        r.number("WaterElevation", terrain.heightmap.water_elevation);
        r.boolean("HasWater", terrain.heightmap.has_water);
        r.integer_array("Samples", terrain.heightmap.samples);
        if (r.error()) error = r.error();
        lua_pop(L, 1);
    }

    lua_pop(L, 1); // AirPath

    if (error) {
        spdlog::warn("Config: {}", error->message);
        return *error;
    }

    if (terrain.source != "flat" && terrain.source != "procedural" &&
        terrain.source != "heightmap") {
        return Error(ErrorCode::ScriptError,
                     "AirPath.Terrain.Source must be \"flat\", \"procedural\" or "
                     "\"heightmap\", got \"" + terrain.source + "\"");
    }
    terrain.procedural.base_height = terrain.height;

    auto grid = grid::GridConfiguration::create(width, height, cell_size, origin,
                                                cost_multiplier, samples_per_cell,
                                                max_iterations);
    if (!grid.ok()) return grid.error();

    return AirPathConfig{grid.value(), search, height_offset, tracking, terrain};
}

Result<std::unique_ptr<terrain::HeightSource>> make_height_source(
    const AirPathConfig& config) {
    terrain::SourceGeometry geometry;
    geometry.width = config.grid.width();
    geometry.height = config.grid.height();
    geometry.cell_size = config.grid.cell_size();
    geometry.origin = config.grid.origin();

    std::unique_ptr<terrain::HeightSource> source;
    if (config.terrain.source == "procedural") {
        source = std::make_unique<terrain::ProceduralHeightSource>(
            geometry, config.terrain.procedural);
    } else if (config.terrain.source == "heightmap") {
        const auto& hm = config.terrain.heightmap;
        auto map = terrain::Heightmap::create(hm.map_width, hm.map_height,
                                              hm.height_scale, hm.samples);
        if (!map.ok()) {
            spdlog::warn("Config: heightmap terrain: {}", map.error().message);
            return map.error();
        }
        auto surface = std::make_shared<const terrain::Terrain>(
            std::move(map.value()), hm.water_elevation, hm.has_water,
            hm.horizontal_scale);
        source = std::make_unique<terrain::TerrainHeightSource>(geometry,
                                                                std::move(surface));
    } else if (config.terrain.source == "flat") {
        source = std::make_unique<terrain::FlatHeightSource>(
            geometry, config.terrain.height);
    } else {
        return Error(ErrorCode::InvalidConfiguration,
                     "unknown terrain source \"" + config.terrain.source + "\"");
    }
    return Result<std::unique_ptr<terrain::HeightSource>>(std::move(source));
}

std::unique_ptr<path::PathfindingCore> make_pathfinding_core(
    const AirPathConfig& config) {
    return std::make_unique<path::PathfindingCore>(config.search, config.tracking);
}

} // namespace airpath::lua

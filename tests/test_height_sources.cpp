#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "terrain/height_sources.hpp"
#include "terrain/heightmap.hpp"
#include "terrain/terrain.hpp"

#include <memory>

using namespace airpath;
using namespace airpath::terrain;
using Catch::Matchers::WithinAbs;

namespace {

SourceGeometry geometry(i32 w, i32 h, f32 cell_size = 1.0f, Vector3 origin = {}) {
    SourceGeometry g;
    g.width = w;
    g.height = h;
    g.cell_size = cell_size;
    g.origin = origin;
    return g;
}

/// 2x2 map with a single raised sample in the middle.
Heightmap center_peak(i16 peak) {
    std::vector<i16> data = {0, 0, 0, 0, peak, 0, 0, 0, 0};
    return Heightmap::create(2, 2, 1.0f, data).value();
}

} // namespace

// ================================================================
// Heightmap
// ================================================================

TEST_CASE("Heightmap grid point queries", "[terrain]") {
    // 2x2 map → 3x3 grid
    std::vector<i16> data = {100, 200, 300, 400, 500, 600, 700, 800, 900};
    auto hm = Heightmap::create(2, 2, 1.0f, data).value();

    REQUIRE(hm.map_width() == 2);
    REQUIRE(hm.grid_width() == 3);
    REQUIRE(hm.grid_height() == 3);

    CHECK_THAT(hm.get_height(0, 0), WithinAbs(100.0, 0.01));
    CHECK_THAT(hm.get_height(2, 0), WithinAbs(300.0, 0.01));
    CHECK_THAT(hm.get_height(1, 1), WithinAbs(500.0, 0.01));
    CHECK_THAT(hm.get_height(2, 2), WithinAbs(900.0, 0.01));
}

TEST_CASE("Heightmap bilinear interpolation", "[terrain]") {
    std::vector<i16> data = {0, 100, 0, 0, 100, 0, 0, 0, 0};
    auto hm = Heightmap::create(2, 2, 0.1f, data).value();

    CHECK_THAT(hm.get_height(1, 0), WithinAbs(10.0, 0.01));
    CHECK_THAT(hm.get_height(0.5f, 0), WithinAbs(5.0, 0.01));
    CHECK_THAT(hm.get_height(1, 0.5f), WithinAbs(10.0, 0.01));
    CHECK_THAT(hm.get_height(0.5f, 0.5f), WithinAbs(5.0, 0.01));
}

TEST_CASE("Heightmap clamps out-of-range coordinates", "[terrain]") {
    auto hm = Heightmap::create(1, 1, 1.0f, {10, 20, 30, 40}).value();
    CHECK_THAT(hm.get_height(-5.0f, -5.0f), WithinAbs(10.0, 0.01));
    CHECK_THAT(hm.get_height(10.0f, 10.0f), WithinAbs(40.0, 0.01));
}

TEST_CASE("Heightmap rejects malformed data", "[terrain]") {
    auto short_data = Heightmap::create(2, 2, 1.0f, {1, 2, 3});
    REQUIRE_FALSE(short_data.ok());
    CHECK(short_data.error().code == ErrorCode::InvalidConfiguration);

    CHECK_FALSE(Heightmap::create(0, 2, 1.0f, {}).ok());
}

// ================================================================
// Terrain
// ================================================================

TEST_CASE("Terrain surface height respects the water plane", "[terrain]") {
    Terrain dry(center_peak(100), 30.0f, false);
    CHECK_THAT(dry.get_surface_height(0, 0), WithinAbs(0.0, 0.01));

    Terrain wet(center_peak(100), 30.0f, true);
    CHECK_THAT(wet.get_terrain_height(0, 0), WithinAbs(0.0, 0.01));
    CHECK_THAT(wet.get_surface_height(0, 0), WithinAbs(30.0, 0.01));
    CHECK_THAT(wet.get_surface_height(1, 1), WithinAbs(100.0, 0.01));
}

TEST_CASE("Terrain horizontal scale stretches the heightmap", "[terrain]") {
    Terrain t(center_peak(100), 0.0f, false, 4.0f);
    CHECK_THAT(t.world_width(), WithinAbs(8.0, 1e-5));
    CHECK_THAT(t.get_terrain_height(4.0f, 4.0f), WithinAbs(100.0, 0.01));
    CHECK_THAT(t.get_terrain_height(2.0f, 4.0f), WithinAbs(50.0, 0.01));
}

// ================================================================
// Height sources
// ================================================================

TEST_CASE("Flat source fills every cell", "[terrain]") {
    FlatHeightSource flat(geometry(3, 2), 7.5f);
    auto samples = flat.sample_all(1);
    REQUIRE(samples.size() == 6);
    for (f32 s : samples) CHECK(s == 7.5f);

    // Super-sampling a flat field changes nothing
    CHECK(flat.sample_all(4) == samples);
}

TEST_CASE("Grid source is row-major and validates its size", "[terrain]") {
    auto src = GridHeightSource::create(geometry(3, 2), {0, 1, 2, 10, 11, 12});
    REQUIRE(src.ok());
    CHECK(src.value().height_at(2, 0) == 2.0f);
    CHECK(src.value().height_at(0, 1) == 10.0f);

    auto samples = src.value().sample_all(1);
    CHECK(samples == std::vector<f32>{0, 1, 2, 10, 11, 12});

    auto bad = GridHeightSource::create(geometry(3, 2), {0, 1, 2});
    REQUIRE_FALSE(bad.ok());
    CHECK(bad.error().code == ErrorCode::InvalidConfiguration);
}

TEST_CASE("Terrain source samples cell centres relative to its origin", "[terrain]") {
    auto terrain = std::make_shared<const Terrain>(center_peak(100), 0.0f);
    TerrainHeightSource src(geometry(2, 2, 1.0f, Vector3{50, 0, -20}), terrain);

    // Cell (0,0) centre is local (0.5, 0.5): a quarter of the peak
    CHECK_THAT(src.height_at(0, 0), WithinAbs(25.0, 0.01));
    CHECK_THAT(src.height_at(1, 1), WithinAbs(25.0, 0.01));
}

TEST_CASE("Super-sampling keeps the highest sample in each cell", "[terrain]") {
    auto terrain = std::make_shared<const Terrain>(center_peak(100), 0.0f);
    TerrainHeightSource src(geometry(2, 2), terrain);

    auto centre = src.sample_all(1);
    auto fine = src.sample_all(2);
    REQUIRE(fine.size() == 4);

    // Nearest sub-sample to the peak sits at (0.75, 0.75)
    CHECK_THAT(centre[0], WithinAbs(25.0, 0.01));
    CHECK_THAT(fine[0], WithinAbs(56.25, 0.01));
    for (size_t i = 0; i < fine.size(); ++i) CHECK(fine[i] >= centre[i]);
}

TEST_CASE("Procedural source is deterministic per seed", "[terrain]") {
    ProceduralParams params;
    params.base_height = 100.0f;
    params.amplitude = 40.0f;
    params.frequency = 0.1f;

    ProceduralHeightSource a(geometry(16, 16, 2.0f), params);
    ProceduralHeightSource b(geometry(16, 16, 2.0f), params);
    auto sa = a.sample_all(1);
    CHECK(sa == b.sample_all(1));

    for (f32 s : sa) {
        CHECK(s >= 100.0f);
        CHECK(s <= 140.0f);
    }

    params.seed = 42;
    ProceduralHeightSource c(geometry(16, 16, 2.0f), params);
    CHECK(c.sample_all(1) != sa);
}

TEST_CASE("Odd super-sampling never lowers the centre sample", "[terrain]") {
    ProceduralParams params;
    params.frequency = 0.3f;
    ProceduralHeightSource src(geometry(10, 10, 3.0f, Vector3{-7, 0, 4}), params);

    // A 3x3 pattern includes the cell centre
    auto centre = src.sample_all(1);
    auto fine = src.sample_all(3);
    REQUIRE(centre.size() == fine.size());
    for (size_t i = 0; i < fine.size(); ++i) {
        CHECK(fine[i] >= centre[i] - 1e-4f);
    }
}

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "grid/elevation_grid.hpp"
#include "grid/grid_config.hpp"

#include <cmath>
#include <limits>

using namespace airpath;
using namespace airpath::grid;
using Catch::Matchers::WithinAbs;

// ================================================================
// GridConfiguration
// ================================================================

TEST_CASE("GridConfiguration accepts a valid grid", "[grid]") {
    auto result = GridConfiguration::create(8, 4, 2.5f, Vector3{10, 0, -5}, 1.5f);
    REQUIRE(result.ok());

    const auto& c = result.value();
    CHECK(c.width() == 8);
    CHECK(c.height() == 4);
    CHECK(c.cell_count() == 32);
    CHECK_THAT(c.cell_size(), WithinAbs(2.5, 1e-6));
    CHECK_THAT(c.origin().x, WithinAbs(10.0, 1e-6));
    CHECK_THAT(c.origin().z, WithinAbs(-5.0, 1e-6));
    CHECK_THAT(c.cost_multiplier(), WithinAbs(1.5, 1e-6));
    CHECK(c.samples_per_cell() == 1);
    CHECK(c.max_iterations() == GridConfiguration::DEFAULT_MAX_ITERATIONS);
    CHECK_THAT(c.world_width(), WithinAbs(20.0, 1e-5));
    CHECK_THAT(c.world_depth(), WithinAbs(10.0, 1e-5));
}

TEST_CASE("GridConfiguration rejects non-positive geometry", "[grid]") {
    const Vector3 o{};
    auto zero_w = GridConfiguration::create(0, 4, 1.0f, o, 1.0f);
    auto neg_h = GridConfiguration::create(4, -1, 1.0f, o, 1.0f);
    auto zero_cs = GridConfiguration::create(4, 4, 0.0f, o, 1.0f);
    auto neg_cs = GridConfiguration::create(4, 4, -2.0f, o, 1.0f);
    auto nan_cs = GridConfiguration::create(4, 4, std::nanf(""), o, 1.0f);

    for (auto* r : {&zero_w, &neg_h, &zero_cs, &neg_cs, &nan_cs}) {
        REQUIRE_FALSE(r->ok());
        CHECK(r->error().code == ErrorCode::InvalidConfiguration);
    }
}

TEST_CASE("GridConfiguration rejects invalid multiplier and limits", "[grid]") {
    const Vector3 o{};
    CHECK_FALSE(GridConfiguration::create(4, 4, 1.0f, o, -0.1f).ok());
    CHECK_FALSE(GridConfiguration::create(
                    4, 4, 1.0f, o, std::numeric_limits<f32>::infinity())
                    .ok());
    CHECK_FALSE(GridConfiguration::create(4, 4, 1.0f, o, 1.0f, 0).ok());
    CHECK_FALSE(GridConfiguration::create(4, 4, 1.0f, o, 1.0f, 1, 0).ok());
    CHECK_FALSE(GridConfiguration::create(
                    4, 4, 1.0f, Vector3{std::nanf(""), 0, 0}, 1.0f)
                    .ok());

    // Zero multiplier is valid: flat-earth search
    CHECK(GridConfiguration::create(4, 4, 1.0f, o, 0.0f).ok());
}

TEST_CASE("GridConfiguration rejects grids too large to index", "[grid]") {
    auto r = GridConfiguration::create(100000, 100000, 1.0f, Vector3{}, 1.0f);
    REQUIRE_FALSE(r.ok());
    CHECK(r.error().code == ErrorCode::InvalidConfiguration);
}

// ================================================================
// ElevationGrid
// ================================================================

TEST_CASE("ElevationGrid indexes row-major", "[grid]") {
    auto config = GridConfiguration::create(3, 2, 1.0f, Vector3{}, 1.0f).value();
    // Row 0: 1 2 3
    // Row 1: 4 5 6
    auto result = ElevationGrid::create(config, {1, 2, 3, 4, 5, 6});
    REQUIRE(result.ok());
    const auto& g = result.value();

    CHECK(g.width() == 3);
    CHECK(g.height() == 2);
    CHECK_THAT(g.elevation_at(0, 0), WithinAbs(1.0, 1e-6));
    CHECK_THAT(g.elevation_at(2, 0), WithinAbs(3.0, 1e-6));
    CHECK_THAT(g.elevation_at(0, 1), WithinAbs(4.0, 1e-6));
    CHECK_THAT(g.elevation_at(2, 1), WithinAbs(6.0, 1e-6));

    CHECK(g.index_of(1, 1) == 4);
    CHECK(g.position_of(5) == GridPos{2, 1});
    CHECK_THAT(g.elevation_at_index(g.index_of(1, 0)), WithinAbs(2.0, 1e-6));

    CHECK_THAT(g.min_elevation(), WithinAbs(1.0, 1e-6));
    CHECK_THAT(g.max_elevation(), WithinAbs(6.0, 1e-6));
}

TEST_CASE("ElevationGrid rejects mismatched or non-finite samples", "[grid]") {
    auto config = GridConfiguration::create(2, 2, 1.0f, Vector3{}, 1.0f).value();

    auto short_data = ElevationGrid::create(config, {0, 0, 0});
    REQUIRE_FALSE(short_data.ok());
    CHECK(short_data.error().code == ErrorCode::InvalidConfiguration);

    auto nan_data = ElevationGrid::create(config, {0, std::nanf(""), 0, 0});
    REQUIRE_FALSE(nan_data.ok());
    CHECK(nan_data.error().code == ErrorCode::InvalidConfiguration);
}

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "path/search_engine.hpp"
#include "test_support.hpp"

#include <cmath>
#include <cstdlib>
#include <random>

using namespace airpath;
using namespace airpath::grid;
using namespace airpath::path;
using airpath::test::cost_to_goal;
using airpath::test::make_config;
using airpath::test::make_grid;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

std::vector<GridPos> to_cells(const ElevationGrid& g, const std::vector<u32>& idx) {
    std::vector<GridPos> out;
    for (u32 i : idx) out.push_back(g.position_of(i));
    return out;
}

std::vector<f32> random_elevations(std::mt19937& rng, u32 count, f32 max_height) {
    std::uniform_real_distribution<f32> d(0.0f, max_height);
    std::vector<f32> v(count);
    for (auto& e : v) e = d(rng);
    return v;
}

} // namespace

// ================================================================
// Scenarios
// ================================================================

TEST_CASE("Flat grid diagonal path", "[search]") {
    auto g = make_grid(make_config(4, 4, 1.0f, 0.0f), std::vector<f32>(16, 0.0f));
    SearchEngine engine;

    auto out = engine.search(g, GridPos{0, 0}, GridPos{3, 3});
    REQUIRE(out.status == PathStatus::Success);
    REQUIRE(out.cells.size() == 4);

    auto cells = to_cells(g, out.cells);
    CHECK(cells.front() == GridPos{0, 0});
    CHECK(cells[1] == GridPos{1, 1});
    CHECK(cells[2] == GridPos{2, 2});
    CHECK(cells.back() == GridPos{3, 3});
    CHECK_THAT(out.total_cost, WithinAbs(3.0 * std::sqrt(2.0), 1e-3));
}

TEST_CASE("Start equals goal", "[search]") {
    auto g = make_grid(make_config(5, 5, 1.0f, 2.0f), std::vector<f32>(25, 7.0f));
    SearchEngine engine;

    auto out = engine.search(g, GridPos{2, 3}, GridPos{2, 3});
    REQUIRE(out.status == PathStatus::Success);
    REQUIRE(out.cells.size() == 1);
    CHECK(g.position_of(out.cells[0]) == GridPos{2, 3});
    CHECK(out.total_cost == 0.0f);
    CHECK(out.nodes_expanded == 0);
    CHECK(engine.touched_count() == 1);
}

TEST_CASE("Path detours around a high ridge", "[search]") {
    // Ridge of height 1000 at x = 5, open only at y = 0 and y = 9
    const i32 n = 10;
    std::vector<f32> elev(n * n, 0.0f);
    for (i32 y = 1; y <= 8; ++y) elev[y * n + 5] = 1000.0f;
    auto g = make_grid(make_config(n, n, 1.0f, 5.0f), elev);

    SearchEngine engine;
    auto out = engine.search(g, GridPos{0, 5}, GridPos{9, 5});
    REQUIRE(out.status == PathStatus::Success);

    bool crossed_column = false;
    for (const auto& c : to_cells(g, out.cells)) {
        CHECK(g.elevation_at(c.x, c.y) == 0.0f);
        if (c.x == 5) crossed_column = true;
    }
    CHECK(crossed_column); // it had to pass through one of the gaps

    // Straight across would pay thousands in climb alone
    CHECK(out.total_cost < 100.0f);
}

TEST_CASE("Zero multiplier ignores elevation", "[search]") {
    const i32 n = 10;
    std::vector<f32> elev(n * n, 0.0f);
    for (i32 y = 1; y <= 8; ++y) elev[y * n + 5] = 1000.0f;
    auto g = make_grid(make_config(n, n, 1.0f, 0.0f), elev);

    SearchEngine engine;
    auto out = engine.search(g, GridPos{0, 5}, GridPos{9, 5});
    REQUIRE(out.status == PathStatus::Success);
    CHECK(out.cells.size() == 10);
    CHECK_THAT(out.total_cost, WithinAbs(9.0, 1e-4));
}

// ================================================================
// Properties
// ================================================================

TEST_CASE("Octile heuristic never overestimates remaining cost", "[search]") {
    std::mt19937 rng(1234);
    const f32 multipliers[] = {0.0f, 0.5f, 2.0f, 10.0f};

    for (f32 mult : multipliers) {
        for (int trial = 0; trial < 5; ++trial) {
            const i32 w = 6, h = 5;
            const f32 cs = trial % 2 == 0 ? 1.0f : 2.5f;
            auto g = make_grid(make_config(w, h, cs, mult),
                               random_elevations(rng, w * h, 100.0f));
            const GridPos goal{static_cast<i32>(rng() % w), static_cast<i32>(rng() % h)};
            auto dist = cost_to_goal(g, goal);

            for (i32 y = 0; y < h; ++y) {
                for (i32 x = 0; x < w; ++x) {
                    const f64 hv = octile_distance(GridPos{x, y}, goal, cs);
                    CHECK(hv <= dist[g.index_of(x, y)] + 1e-4);
                }
            }
        }
    }
}

TEST_CASE("Returned paths are optimal", "[search]") {
    std::mt19937 rng(987);
    SearchEngine engine;

    for (int trial = 0; trial < 25; ++trial) {
        const i32 w = 5 + static_cast<i32>(rng() % 16); // 5..20
        const i32 h = 5 + static_cast<i32>(rng() % 16);
        const f32 mult = static_cast<f32>(rng() % 4);    // 0..3
        auto g = make_grid(make_config(w, h, 1.0f, mult),
                           random_elevations(rng, w * h, 60.0f));

        const GridPos start{static_cast<i32>(rng() % w), static_cast<i32>(rng() % h)};
        const GridPos goal{static_cast<i32>(rng() % w), static_cast<i32>(rng() % h)};

        auto out = engine.search(g, start, goal);
        REQUIRE(out.status == PathStatus::Success);

        auto dist = cost_to_goal(g, goal);
        const f64 best = dist[g.index_of(start.x, start.y)];
        const auto cells = to_cells(g, out.cells);

        CHECK(cells.front() == start);
        CHECK(cells.back() == goal);
        if (best == 0.0) {
            CHECK(out.total_cost == 0.0f);
        } else {
            CHECK_THAT(static_cast<f64>(out.total_cost), WithinRel(best, 1e-4));
            CHECK_THAT(test::path_cost(g, cells), WithinRel(best, 1e-4));
        }
    }
}

TEST_CASE("Paths use only neighbour steps and never cut corners", "[search]") {
    std::mt19937 rng(55);
    SearchEngine engine;

    for (int trial = 0; trial < 20; ++trial) {
        const i32 w = 1 + static_cast<i32>(rng() % 8);
        const i32 h = 1 + static_cast<i32>(rng() % 8);
        auto g = make_grid(make_config(w, h, 1.0f, 1.0f),
                           random_elevations(rng, w * h, 30.0f));
        const GridPos start{static_cast<i32>(rng() % w), static_cast<i32>(rng() % h)};
        const GridPos goal{static_cast<i32>(rng() % w), static_cast<i32>(rng() % h)};

        auto out = engine.search(g, start, goal);
        REQUIRE(out.status == PathStatus::Success);
        const auto cells = to_cells(g, out.cells);

        auto in_bounds = [&](i32 x, i32 y) { return x >= 0 && y >= 0 && x < w && y < h; };
        for (size_t i = 1; i < cells.size(); ++i) {
            const i32 dx = cells[i].x - cells[i - 1].x;
            const i32 dy = cells[i].y - cells[i - 1].y;
            REQUIRE(std::abs(dx) <= 1);
            REQUIRE(std::abs(dy) <= 1);
            REQUIRE((dx != 0 || dy != 0));
            if (dx != 0 && dy != 0) {
                const bool flank_a = in_bounds(cells[i - 1].x + dx, cells[i - 1].y);
                const bool flank_b = in_bounds(cells[i - 1].x, cells[i - 1].y + dy);
                CHECK((flank_a || flank_b));
            }
        }
    }
}

TEST_CASE("Single-row grid moves only along the row", "[search]") {
    auto g = make_grid(make_config(6, 1, 1.0f, 1.0f), {0, 3, 1, 4, 1, 5});
    SearchEngine engine;

    auto out = engine.search(g, GridPos{0, 0}, GridPos{5, 0});
    REQUIRE(out.status == PathStatus::Success);
    REQUIRE(out.cells.size() == 6);
    for (size_t i = 0; i < out.cells.size(); ++i) {
        CHECK(g.position_of(out.cells[i]) == GridPos{static_cast<i32>(i), 0});
    }
}

// ================================================================
// Working memory and limits
// ================================================================

TEST_CASE("Search is deterministic and reuse matches a fresh engine", "[search]") {
    std::mt19937 rng(7);
    auto g = make_grid(make_config(16, 16, 1.0f, 1.0f),
                       random_elevations(rng, 256, 20.0f));

    SearchEngine reused;
    // Dirty the buffers with unrelated searches first
    (void)reused.search(g, GridPos{15, 0}, GridPos{0, 15});
    (void)reused.search(g, GridPos{3, 3}, GridPos{3, 4});

    SearchEngine fresh;
    auto a = reused.search(g, GridPos{0, 0}, GridPos{15, 15});
    auto b = fresh.search(g, GridPos{0, 0}, GridPos{15, 15});
    auto c = fresh.search(g, GridPos{0, 0}, GridPos{15, 15});

    REQUIRE(a.status == PathStatus::Success);
    CHECK(a.cells == b.cells);
    CHECK(b.cells == c.cells);
    CHECK(a.total_cost == b.total_cost);
    CHECK(a.nodes_expanded == b.nodes_expanded);
}

TEST_CASE("Reset touches only visited nodes", "[search]") {
    auto g = make_grid(make_config(100, 100, 1.0f, 0.0f),
                       std::vector<f32>(10000, 0.0f));
    SearchEngine engine;
    engine.prepare(g.cell_count());

    auto out = engine.search(g, GridPos{50, 50}, GridPos{53, 50});
    REQUIRE(out.status == PathStatus::Success);
    CHECK(out.cells.size() == 4);
    CHECK(engine.touched_count() < 100);

    // Seed node carries g = 0 and the octile estimate
    const auto& seed = engine.node(g.index_of(50, 50));
    CHECK(seed.g == 0.0f);
    CHECK_THAT(seed.h, WithinAbs(3.0, 1e-5));
    CHECK(seed.state == SearchEngine::NodeState::Closed);
}

TEST_CASE("Iteration cap reports IterationLimitExceeded", "[search]") {
    auto g = make_grid(make_config(30, 30, 1.0f, 1.0f, 5),
                       std::vector<f32>(900, 0.0f));
    SearchEngine engine;

    auto out = engine.search(g, GridPos{0, 0}, GridPos{29, 29});
    CHECK(out.status == PathStatus::IterationLimitExceeded);
    CHECK(out.cells.empty());
    CHECK(out.nodes_expanded == 6);

    // A goal within reach still succeeds under the same cap
    auto near = engine.search(g, GridPos{0, 0}, GridPos{2, 2});
    CHECK(near.status == PathStatus::Success);
}

TEST_CASE("Engine adapts to a grid of a different size", "[search]") {
    SearchEngine engine;
    auto small = make_grid(make_config(3, 3), std::vector<f32>(9, 0.0f));
    auto large = make_grid(make_config(12, 9), std::vector<f32>(108, 0.0f));

    CHECK(engine.search(small, GridPos{0, 0}, GridPos{2, 2}).status == PathStatus::Success);
    auto out = engine.search(large, GridPos{0, 0}, GridPos{11, 8});
    REQUIRE(out.status == PathStatus::Success);
    CHECK(large.position_of(out.cells.back()) == GridPos{11, 8});
}

TEST_CASE("Open heap capacity survives repeated searches", "[search]") {
    std::mt19937 rng(7);
    auto g = make_grid(make_config(24, 24, 1.0f, 4.0f),
                       random_elevations(rng, 24 * 24, 60.0f));
    SearchEngine engine;
    engine.prepare(g.cell_count());
    CHECK(engine.open_capacity() >= 2 * static_cast<size_t>(g.cell_count()));

    auto first = engine.search(g, GridPos{0, 0}, GridPos{23, 23});
    REQUIRE(first.status == PathStatus::Success);
    const size_t capacity = engine.open_capacity();

    // Same request on reused buffers: no further growth
    auto second = engine.search(g, GridPos{0, 0}, GridPos{23, 23});
    REQUIRE(second.status == PathStatus::Success);
    CHECK(engine.open_capacity() == capacity);
    CHECK(second.cells == first.cells);
}

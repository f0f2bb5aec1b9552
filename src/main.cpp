#include "core/log.hpp"
#include "core/types.hpp"
#include "lua/config_loader.hpp"
#include "path/pathfinding_core.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <spdlog/spdlog.h>

static void print_usage() {
    std::cout << "AirPath v0.1.0\n"
              << "Height-aware grid pathfinding for aerial agents\n\n"
              << "Usage:\n"
              << "  airpath [options] --from <x,z> --to <x,z>\n\n"
              << "Options:\n"
              << "  --config <path>    Lua configuration script (defines AirPath)\n"
              << "  --log <path>       Log file (default: airpath.log)\n"
              << "  --from <x,z>       Start position\n"
              << "  --to <x,z>         Goal position\n"
              << "  --offset <h>       Height above terrain (default: from config)\n"
              << "  --grid             Interpret --from/--to as grid cells\n"
              << "  --strict           Reject out-of-bounds positions instead of clamping\n"
              << "  --help             Show this help message\n";
}

struct CliOptions {
    airpath::fs::path config_file;
    airpath::fs::path log_file = "airpath.log";
    std::optional<std::pair<double, double>> from;
    std::optional<std::pair<double, double>> to;
    std::optional<float> offset;
    bool grid_coords = false;
    bool strict = false;
};

static std::optional<std::pair<double, double>> parse_pair(const char* s) {
    double a = 0, b = 0;
    if (std::sscanf(s, "%lf,%lf", &a, &b) != 2) return std::nullopt;
    return std::make_pair(a, b);
}

static std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            opts.config_file = argv[++i];
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            opts.log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--from") == 0 && i + 1 < argc) {
            opts.from = parse_pair(argv[++i]);
            if (!opts.from) return std::nullopt;
        } else if (std::strcmp(argv[i], "--to") == 0 && i + 1 < argc) {
            opts.to = parse_pair(argv[++i]);
            if (!opts.to) return std::nullopt;
        } else if (std::strcmp(argv[i], "--offset") == 0 && i + 1 < argc) {
            float h = 0;
            if (std::sscanf(argv[++i], "%f", &h) != 1) return std::nullopt;
            opts.offset = h;
        } else if (std::strcmp(argv[i], "--grid") == 0) {
            opts.grid_coords = true;
        } else if (std::strcmp(argv[i], "--strict") == 0) {
            opts.strict = true;
        } else if (std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            std::exit(0);
        } else {
            std::cerr << "Unknown or incomplete option: " << argv[i] << "\n";
            return std::nullopt;
        }
    }
    if (!opts.from || !opts.to) return std::nullopt;
    return opts;
}

int main(int argc, char* argv[]) {
    using namespace airpath;

    auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage();
        return 1;
    }

    airpath::log::init(opts->log_file);

    lua::AirPathConfig config = lua::ConfigLoader::defaults();
    if (!opts->config_file.empty()) {
        auto loaded = lua::ConfigLoader::load_file(opts->config_file);
        if (!loaded.ok()) {
            spdlog::error("Configuration failed ({}): {}",
                          error_code_name(loaded.error().code),
                          loaded.error().message);
            airpath::log::shutdown();
            return 1;
        }
        config = loaded.value();
    }
    if (opts->strict) config.search.clamp_out_of_bounds = false;
    const f32 offset = opts->offset.value_or(config.height_offset);

    auto source = lua::make_height_source(config);
    if (!source.ok()) {
        spdlog::error("Height source: {}", source.error().message);
        airpath::log::shutdown();
        return 1;
    }

    auto core_ptr = lua::make_pathfinding_core(config);
    path::PathfindingCore& core = *core_ptr;
    path::PathEvents events;
    events.on_boundary_violation = [](const path::BoundaryViolationEvent& ev) {
        spdlog::warn("Boundary violation: ({}, {}) -> ({}, {}){}", ev.original.x,
                     ev.original.y, ev.clamped.x, ev.clamped.y,
                     ev.auto_clamped ? "" : " [rejected]");
    };
    core.set_events(std::move(events));

    auto init = core.initialize(config.grid, *source.value());
    if (!init.ok()) {
        spdlog::error("Initialization failed ({}): {}",
                      error_code_name(init.error().code), init.error().message);
        airpath::log::shutdown();
        return 1;
    }

    path::PathResult result;
    if (opts->grid_coords) {
        grid::GridPos s{static_cast<i32>(opts->from->first),
                        static_cast<i32>(opts->from->second)};
        grid::GridPos e{static_cast<i32>(opts->to->first),
                        static_cast<i32>(opts->to->second)};
        result = core.calculate_path(s, e, offset);
    } else {
        Vector3 s{static_cast<f32>(opts->from->first), 0,
                  static_cast<f32>(opts->from->second)};
        Vector3 e{static_cast<f32>(opts->to->first), 0,
                  static_cast<f32>(opts->to->second)};
        result = core.calculate_path(s, e, offset);
    }

    if (!result.success) {
        spdlog::error("No path ({}) after {} nodes",
                      path::path_status_name(result.status), result.nodes_expanded);
        airpath::log::shutdown();
        return 2;
    }

    spdlog::info("Path: {} waypoints, cost {:.3f}, {} nodes, {:.3f} ms",
                 result.waypoints.size(), result.total_cost,
                 result.nodes_expanded, result.elapsed_ms);
    for (size_t i = 0; i < result.waypoints.size(); ++i) {
        const auto& w = result.waypoints[i];
        std::cout << i << ": " << w.x << " " << w.y << " " << w.z << "\n";
    }

    airpath::log::shutdown();
    return 0;
}

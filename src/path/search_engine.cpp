#include "path/search_engine.hpp"
#include "grid/cost_model.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>

namespace airpath::path {

// 8 directions: cardinals first, then diagonals
static constexpr i32 DIRS[8][2] = {
    {1, 0}, {-1, 0}, {0, 1}, {0, -1},
    {1, 1}, {1, -1}, {-1, 1}, {-1, -1}
};

void SearchEngine::prepare(u32 cell_count) {
    nodes_.assign(cell_count, SearchNode{});
    touched_.clear();
    touched_.reserve(cell_count);
    open_.clear();
    open_.reserve(static_cast<size_t>(cell_count) * 2);
}

void SearchEngine::reset() {
    for (u32 idx : touched_) {
        nodes_[idx] = SearchNode{};
    }
    touched_.clear();
    open_.clear();
}

void SearchEngine::push_open(u32 idx) {
    const auto& n = nodes_[idx];
    open_.push_back({n.f, n.h, idx});
    std::push_heap(open_.begin(), open_.end(), WorseEntry{});
}

SearchEngine::OpenEntry SearchEngine::pop_open() {
    std::pop_heap(open_.begin(), open_.end(), WorseEntry{});
    OpenEntry e = open_.back();
    open_.pop_back();
    return e;
}

SearchEngine::Outcome SearchEngine::search(const grid::ElevationGrid& grid,
                                           const grid::GridPos& start,
                                           const grid::GridPos& goal) {
    using grid::StepKind;

    if (nodes_.size() != grid.cell_count()) {
        prepare(grid.cell_count());
    } else {
        reset();
    }

    const i32 w = grid.width();
    const i32 h = grid.height();
    const f32 cs = grid.config().cell_size();
    const f32 mult = grid.config().cost_multiplier();
    const u32 max_iterations = grid.config().max_iterations();

    auto in_bounds = [w, h](i32 x, i32 y) {
        return x >= 0 && y >= 0 && x < w && y < h;
    };

    Outcome out;
    const u32 start_idx = grid.index_of(start.x, start.y);
    const u32 goal_idx = grid.index_of(goal.x, goal.y);

    // Seed
    {
        auto& s = nodes_[start_idx];
        touched_.push_back(start_idx);
        s.g = 0;
        s.h = grid::octile_distance(start, goal, cs);
        s.f = s.h;
        s.state = NodeState::Open;
    }

    if (start_idx == goal_idx) {
        out.status = PathStatus::Success;
        out.cells.push_back(start_idx);
        return out;
    }

    push_open(start_idx);

    while (!open_.empty()) {
        const OpenEntry top = pop_open();
        auto& cur = nodes_[top.idx];

        // Stale duplicate of a node already expanded
        if (cur.state == NodeState::Closed) continue;

        if (top.idx == goal_idx) {
            out.status = PathStatus::Success;
            out.cells = reconstruct(goal_idx);
            out.total_cost = cur.g;
            return out;
        }

        cur.state = NodeState::Closed;
        if (++out.nodes_expanded > max_iterations) {
            spdlog::debug("SearchEngine: hit iteration limit ({} nodes)",
                          max_iterations);
            out.status = PathStatus::IterationLimitExceeded;
            return out;
        }

        const grid::GridPos cp = grid.position_of(top.idx);
        const f32 cur_elev = grid.elevation_at_index(top.idx);
        const f32 cur_g = cur.g;

        for (const auto& dir : DIRS) {
            const i32 nx = cp.x + dir[0];
            const i32 ny = cp.y + dir[1];
            if (!in_bounds(nx, ny)) continue;

            const bool diagonal = (dir[0] != 0 && dir[1] != 0);

            // No corner cutting: a diagonal needs at least one flanking
            // cardinal cell inside the grid.
            if (diagonal && !in_bounds(nx, cp.y) && !in_bounds(cp.x, ny))
                continue;

            const u32 n_idx = grid.index_of(nx, ny);
            auto& nb = nodes_[n_idx];
            if (nb.state == NodeState::Closed) continue;

            const f32 step = grid::edge_cost(
                cur_elev, grid.elevation_at_index(n_idx),
                diagonal ? StepKind::Diagonal : StepKind::Cardinal, cs, mult);
            const f32 tentative = cur_g + step;

            if (nb.state == NodeState::Unvisited) {
                touched_.push_back(n_idx);
                nb.h = grid::octile_distance(nx - goal.x, ny - goal.y, cs);
            } else if (tentative >= nb.g) {
                continue;
            }

            nb.g = tentative;
            nb.f = tentative + nb.h;
            nb.parent = top.idx;
            nb.state = NodeState::Open;
            push_open(n_idx);
        }
    }

    out.status = PathStatus::NoPathFound;
    return out;
}

std::vector<u32> SearchEngine::reconstruct(u32 goal_idx) const {
    std::vector<u32> path;
    for (u32 cur = goal_idx; cur != NO_PARENT; cur = nodes_[cur].parent) {
        path.push_back(cur);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

} // namespace airpath::path

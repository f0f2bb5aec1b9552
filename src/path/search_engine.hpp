#pragma once

#include "core/types.hpp"
#include "grid/elevation_grid.hpp"
#include "grid/grid_types.hpp"
#include "path/path_types.hpp"

#include <limits>
#include <vector>

namespace airpath::path {

/// Height-aware A* over an ElevationGrid.
///
/// Working memory (one SearchNode per cell, the open heap and the touched
/// list) is allocated once per grid size and reused across searches. Only
/// nodes touched by the previous search are reset, so re-initialisation costs
/// O(nodes visited) rather than O(grid size).
///
/// The open heap uses lazy deletion: an improved node is pushed again and its
/// stale entry skipped when popped, so the heap can outgrow the cell count.
/// It starts at twice the cell count; growth beyond that is kept for later
/// searches.
///
/// Not thread-safe: one search at a time per instance.
class SearchEngine {
public:
    static constexpr u32 NO_PARENT = std::numeric_limits<u32>::max();
    static constexpr f32 INF = std::numeric_limits<f32>::infinity();

    enum class NodeState : u8 { Unvisited, Open, Closed };

    struct SearchNode {
        f32 g = INF;
        f32 h = 0;
        f32 f = INF;
        u32 parent = NO_PARENT;
        NodeState state = NodeState::Unvisited;
    };

    struct Outcome {
        PathStatus status = PathStatus::NoPathFound;
        std::vector<u32> cells; // grid indices, start -> goal
        f32 total_cost = 0;
        u32 nodes_expanded = 0;
    };

    /// Size the working buffers for a grid. Drops all previous search state.
    void prepare(u32 cell_count);

    /// Run one search. start and goal must be in range of grid.
    /// Buffers are resized automatically if grid does not match prepare().
    Outcome search(const grid::ElevationGrid& grid, const grid::GridPos& start,
                   const grid::GridPos& goal);

    /// Nodes touched by the most recent search.
    size_t touched_count() const { return touched_.size(); }

    size_t open_capacity() const { return open_.capacity(); }

    const SearchNode& node(u32 idx) const { return nodes_[idx]; }

private:
    struct OpenEntry {
        f32 f;
        f32 h;
        u32 idx;
    };

    /// Heap ordering: lowest f first, ties to lower h (closer to the goal),
    /// then lower cell index.
    struct WorseEntry {
        bool operator()(const OpenEntry& a, const OpenEntry& b) const {
            if (a.f != b.f) return a.f > b.f;
            if (a.h != b.h) return a.h > b.h;
            return a.idx > b.idx;
        }
    };

    void reset();
    void push_open(u32 idx);
    OpenEntry pop_open();
    std::vector<u32> reconstruct(u32 goal_idx) const;

    std::vector<SearchNode> nodes_;
    std::vector<u32> touched_;
    std::vector<OpenEntry> open_;
};

} // namespace airpath::path

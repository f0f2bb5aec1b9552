#pragma once

#include "core/types.hpp"

namespace airpath::grid {

/// Integer cell coordinate on the navigable plane (x along world X, y along world Z).
struct GridPos {
    i32 x = 0;
    i32 y = 0;

    bool operator==(const GridPos& o) const { return x == o.x && y == o.y; }
    bool operator!=(const GridPos& o) const { return !(*this == o); }
};

enum class StepKind : u8 {
    Cardinal,
    Diagonal,
};

} // namespace airpath::grid

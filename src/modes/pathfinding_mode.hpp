#pragma once

#include "core/types.hpp"
#include "path/path_types.hpp"

#include <optional>

namespace airpath::modes {

/// A policy for when and between which points searches are issued.
class PathfindingMode {
public:
    virtual ~PathfindingMode() = default;

    virtual const char* name() const = 0;

    virtual void activate(f64 now) = 0;
    virtual void deactivate() = 0;

    /// Advance the mode. Returns a result when a search was issued.
    virtual std::optional<path::PathResult> update(f64 now) = 0;
};

} // namespace airpath::modes

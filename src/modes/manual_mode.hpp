#pragma once

#include "modes/pathfinding_mode.hpp"

namespace airpath::path {
class PathfindingCore;
}

namespace airpath::modes {

/// One-shot requests: the caller queues a start/end pair and the next
/// update() searches it. A newer request replaces one not yet processed.
class ManualMode final : public PathfindingMode {
public:
    explicit ManualMode(path::PathfindingCore& core, f32 height_offset = 0.0f);

    const char* name() const override { return "Manual"; }

    void activate(f64 now) override;
    void deactivate() override;
    std::optional<path::PathResult> update(f64 now) override;

    void request(const Vector3& start, const Vector3& end);
    bool has_pending() const { return pending_.has_value(); }

    void set_height_offset(f32 offset) { height_offset_ = offset; }

private:
    struct Pending {
        Vector3 start;
        Vector3 end;
    };

    path::PathfindingCore& core_;
    f32 height_offset_;
    bool active_ = false;
    std::optional<Pending> pending_;
};

} // namespace airpath::modes

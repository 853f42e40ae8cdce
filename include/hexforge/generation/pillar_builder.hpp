// HexForge Generation
// pillar_builder.hpp - Brazier pillars standing on the pillar anchors

#pragma once

#include "build_context.hpp"

#include <hexforge/geometry/types.hpp>

#include <vector>

namespace hexforge::generation {

// One pillar composite. Every part is parented to `anchor`, which sits at the
// pillar's (x, y) on the floor; parts are placed in the anchor's frame.
struct PillarAssembly {
    NodeHandle anchor;
    geometry::Point2 position{0.0};
    MeshHandle shaft;
    MeshHandle base;
    MeshHandle cap;
    MeshHandle brazier;
    std::vector<MeshHandle> fire;
    MeshHandle crystal;
    NodeHandle crystal_light;
    NodeHandle fire_light;

    [[nodiscard]] size_t mesh_count() const { return 5 + fire.size(); }

    // Height of the shaft's top rim above the floor
    double top_z = 0.0;
};

class PillarBuilder {
public:
    explicit PillarBuilder(const BuildContext& ctx) : ctx_(ctx) {}

    // Builds one pillar per anchor point, in anchor order
    std::vector<PillarAssembly> build(const std::vector<geometry::Point2>& anchors);

    PillarAssembly build_one(const geometry::Point2& position, uint32_t index);

private:
    const BuildContext& ctx_;
};

}  // namespace hexforge::generation

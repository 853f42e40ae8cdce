// HexForge Generation
// decoration_builders.hpp - Edge spikes, skull/horn scatter and rune decals

#pragma once

#include "build_context.hpp"

#include <vector>

namespace hexforge::generation {

/// spikes_per_edge cones on every edge of the pi/6-rotated platform outline,
/// yawed to the edge direction.
class EdgeSpikeBuilder {
public:
    explicit EdgeSpikeBuilder(const BuildContext& ctx) : ctx_(ctx) {}

    std::vector<MeshHandle> build();

    // Spike circle sits just outside the platform rim
    static constexpr double RIM_OFFSET = 0.05;

private:
    const BuildContext& ctx_;
};

struct ScatterResult {
    std::vector<MeshHandle> skulls;
    std::vector<MeshHandle> horns;
};

/// Skulls scattered uniformly over a disk with the run's random engine, and
/// horns on a fixed hexagonal layout around the altar.
class ScatterBuilder {
public:
    explicit ScatterBuilder(const BuildContext& ctx) : ctx_(ctx) {}

    ScatterResult build();

    std::vector<MeshHandle> build_skulls();
    std::vector<MeshHandle> build_horns();

private:
    const BuildContext& ctx_;
};

/// Jittered plane decals just above the outer and middle rings
class RuneBuilder {
public:
    explicit RuneBuilder(const BuildContext& ctx) : ctx_(ctx) {}

    std::vector<MeshHandle> build();

private:
    const BuildContext& ctx_;
};

}  // namespace hexforge::generation

// HexForge Generation
// structure_builders.hpp - Floor slab and ritual rings

#pragma once

#include "build_context.hpp"

#include <array>

namespace hexforge::generation {

/// Beveled hexagonal slab whose top face sits at z = 0, rotated by pi/6 so a
/// flat side faces +X.
class FloorBuilder {
public:
    explicit FloorBuilder(const BuildContext& ctx) : ctx_(ctx) {}

    MeshHandle build();

private:
    const BuildContext& ctx_;
};

struct RitualRings {
    MeshHandle outer;
    MeshHandle middle;
    MeshHandle inner;

    [[nodiscard]] std::array<MeshHandle, 3> all() const { return {outer, middle, inner}; }
};

/// Three concentric rings lying on the floor: hexagonal outer and middle
/// rings, and a circular inner ring for contrast.
class RitualRingBuilder {
public:
    explicit RitualRingBuilder(const BuildContext& ctx) : ctx_(ctx) {}

    RitualRings build();

private:
    const BuildContext& ctx_;
};

}  // namespace hexforge::generation

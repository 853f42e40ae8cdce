// HexForge Generation
// altar_builder.hpp - Central stepped altar with its fire column and soul orb

#pragma once

#include "build_context.hpp"

#include <array>

namespace hexforge::generation {

struct AltarAssembly {
    NodeHandle anchor;
    std::array<MeshHandle, 3> tiers{};
    MeshHandle fire_column;
    MeshHandle orb;
    NodeHandle light;

    [[nodiscard]] size_t mesh_count() const { return tiers.size() + 2; }
};

/// Three hexagonal tiers (rotated pi/6 like the floor), a thin fire column and
/// a glowing orb, grouped under an "Altar" anchor at the origin.
class AltarBuilder {
public:
    explicit AltarBuilder(const BuildContext& ctx) : ctx_(ctx) {}

    AltarAssembly build();

private:
    const BuildContext& ctx_;
};

}  // namespace hexforge::generation

// HexForge Generation
// platform_generator.hpp - Full boss platform pipeline

#pragma once

#include "altar_builder.hpp"
#include "curve_decorations.hpp"
#include "parameter_set.hpp"
#include "pillar_builder.hpp"
#include "structure_builders.hpp"

#include <vector>

namespace hexforge::generation {

// Handles of everything one run created
struct GenerationResult {
    NodeHandle root;
    MeshHandle floor;
    RitualRings rings;
    std::vector<geometry::Point2> pillar_anchors;
    std::vector<PillarAssembly> pillars;
    AltarAssembly altar;
    std::vector<MeshHandle> spikes;
    std::vector<MeshHandle> skulls;
    std::vector<MeshHandle> horns;

    // Optional features
    std::vector<MeshHandle> runes;
    std::vector<CurveGroup> chains;
    std::vector<CurveGroup> lava_cracks;
    std::vector<CurveGroup> rune_beams;

    /// Direct children of the root
    [[nodiscard]] size_t top_level_count() const;

    /// Mesh nodes anywhere in the hierarchy
    [[nodiscard]] size_t mesh_count() const;

    [[nodiscard]] size_t light_count() const;
};

class PlatformGenerator {
public:
    /// Validates params; throws ParameterError
    explicit PlatformGenerator(const ParameterSet& params);

    /// Runs every builder in a fixed order and assembles the single-root scene.
    /// Any GenerationError aborts the run; the host is then left partially built
    /// and must not be exported.
    GenerationResult generate(scene::SceneHost& host) const;

    [[nodiscard]] const ParameterSet& get_params() const { return params_; }

private:
    ParameterSet params_;
};

}  // namespace hexforge::generation

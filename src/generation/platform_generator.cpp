// HexForge Generation
// platform_generator.cpp - Full boss platform pipeline

#include <hexforge/core/logger.hpp>
#include <hexforge/generation/decoration_builders.hpp>
#include <hexforge/generation/platform_generator.hpp>
#include <hexforge/generation/scene_assembler.hpp>
#include <hexforge/geometry/radial_layout.hpp>
#include <utility>

namespace hexforge::generation {

namespace {

size_t curve_segments(const std::vector<CurveGroup>& groups) {
    size_t count = 0;
    for (const auto& group : groups) {
        count += group.segments.size();
    }
    return count;
}

}  // namespace

size_t GenerationResult::top_level_count() const {
    return 1 + rings.all().size() + pillars.size() + 1 + spikes.size() + skulls.size() + horns.size() + runes.size() +
           chains.size() + lava_cracks.size() + rune_beams.size();
}

size_t GenerationResult::mesh_count() const {
    size_t count = 1 + rings.all().size() + altar.mesh_count();
    for (const auto& pillar : pillars) {
        count += pillar.mesh_count();
    }
    count += spikes.size() + skulls.size() + horns.size() + runes.size();
    count += curve_segments(chains) + curve_segments(lava_cracks) + curve_segments(rune_beams);
    return count;
}

size_t GenerationResult::light_count() const {
    return pillars.size() * 2 + 1;
}

PlatformGenerator::PlatformGenerator(const ParameterSet& params) : params_(params) {
    params_.validate();
}

GenerationResult PlatformGenerator::generate(scene::SceneHost& host) const {
    HEXFORGE_LOG_INFO(core::log_category::GENERATOR, "Generating boss platform (seed {}, backend '{}')", params_.seed,
                      host.get_backend_name());

    geometry::RandomEngine rng(params_.seed);
    PrimitiveFactory factory(host);
    const BuildContext ctx{.host = host, .factory = factory, .params = params_, .rng = rng};

    GenerationResult result;

    // Structure
    result.floor = FloorBuilder(ctx).build();
    result.rings = RitualRingBuilder(ctx).build();

    // Pillar anchors are computed once and shared by pillars, chains and beams
    result.pillar_anchors =
        geometry::RadialLayout::pillar_anchors(params_.pillar_ring_radius(), params_.pillars.count);
    result.pillars = PillarBuilder(ctx).build(result.pillar_anchors);
    result.altar = AltarBuilder(ctx).build();

    // Decorations, in a fixed order because skulls and runes draw from rng
    result.spikes = EdgeSpikeBuilder(ctx).build();
    auto scatter = ScatterBuilder(ctx).build();
    result.skulls = std::move(scatter.skulls);
    result.horns = std::move(scatter.horns);

    if (params_.features.runes) {
        result.runes = RuneBuilder(ctx).build();
    }

    CurveDecorationBuilder curves(ctx);
    if (params_.features.lava_cracks) {
        result.lava_cracks = curves.build_lava_cracks();
    }
    if (params_.features.chains) {
        result.chains = curves.build_chains(result.pillar_anchors);
    }
    if (params_.features.rune_beams) {
        result.rune_beams = curves.build_rune_beams(result.pillar_anchors);
    }

    result.root = SceneAssembler::assemble(host);

    HEXFORGE_LOG_INFO(core::log_category::GENERATOR, "Generated {} meshes, {} lights, {} top-level objects ({} primitives)",
                      result.mesh_count(), result.light_count(), result.top_level_count(), factory.created_count());
    return result;
}

}  // namespace hexforge::generation

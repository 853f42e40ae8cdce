// HexForge Generation
// structure_builders.cpp - Floor slab and ritual rings

#include <hexforge/core/logger.hpp>
#include <hexforge/generation/ring_carver.hpp>
#include <hexforge/generation/structure_builders.hpp>

namespace hexforge::generation {

using geometry::HEX_ORIENTATION_OFFSET;
using scene::MaterialId;

MeshHandle FloorBuilder::build() {
    const auto& platform = ctx_.params.platform;

    const Pose3 pose = Pose3::at({0.0, 0.0, -platform.height * 0.5}, HEX_ORIENTATION_OFFSET);
    MeshHandle floor = ctx_.factory.cylinder(platform.sides, platform.radius, platform.height, pose, "Floor");
    if (platform.bevel_width > 0.0) {
        ctx_.host.bevel_edges(floor, platform.bevel_width, platform.bevel_segments);
    }
    ctx_.tagged(floor, MaterialId::FloorStone);

    HEXFORGE_LOG_DEBUG(core::log_category::GENERATOR, "Floor: {}-sided slab, radius {}", platform.sides,
                       platform.radius);
    return floor;
}

RitualRings RitualRingBuilder::build() {
    const auto& rings = ctx_.params.rings;
    const uint32_t hex_sides = ctx_.params.platform.sides;
    RingCarver carver(ctx_.factory);

    auto spec = [&](double radius, uint32_t sides, double yaw, const char* name) {
        return RingSpec{.outer_radius = radius,
                        .thickness = rings.thickness,
                        .height = rings.height,
                        .sides = sides,
                        .yaw = yaw,
                        .epsilon = rings.carve_epsilon,
                        .center_z = rings.height * 0.5,
                        .name = name};
    };

    RitualRings result;
    result.outer = ctx_.tagged(carver.carve(spec(rings.outer_radius, hex_sides, HEX_ORIENTATION_OFFSET,
                                                 "Ritual_Ring_Outer")),
                               MaterialId::RitualGlow);
    result.middle = ctx_.tagged(carver.carve(spec(rings.middle_radius, hex_sides, HEX_ORIENTATION_OFFSET,
                                                  "Ritual_Ring_Middle")),
                                MaterialId::RitualGlow);
    result.inner = ctx_.tagged(
        carver.carve(spec(rings.inner_radius, rings.circle_segments, 0.0, "Ritual_Ring_Inner")),
        MaterialId::RitualGlow);

    HEXFORGE_LOG_DEBUG(core::log_category::GENERATOR, "Ritual rings at radii {} / {} / {}", rings.outer_radius,
                       rings.middle_radius, rings.inner_radius);
    return result;
}

}  // namespace hexforge::generation

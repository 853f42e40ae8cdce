// HexForge Generation
// altar_builder.cpp - Central stepped altar with its fire column and soul orb

#include <hexforge/core/logger.hpp>
#include <hexforge/generation/altar_builder.hpp>

namespace hexforge::generation {

using geometry::HEX_ORIENTATION_OFFSET;
using scene::MaterialId;

namespace {

struct Tier {
    double radius;
    double depth;
    double center_z;
    MaterialId material;
    const char* name;
};

constexpr std::array<Tier, 3> TIERS = {{
    {1.2, 0.25, 0.125, MaterialId::Obsidian, "Altar_Base"},
    {0.8, 0.2, 0.35, MaterialId::Obsidian, "Altar_Mid"},
    {0.5, 0.1, 0.5, MaterialId::AltarStone, "Altar_Top"},
}};

constexpr uint32_t COLUMN_SIDES = 16;
constexpr double COLUMN_RADIUS = 0.12;
constexpr double COLUMN_DEPTH = 1.2;
constexpr double COLUMN_CENTER_Z = 1.15;

constexpr uint32_t ORB_SEGMENTS = 16;
constexpr uint32_t ORB_RINGS = 12;
constexpr double ORB_RADIUS = 0.2;
constexpr double ORB_CENTER_Z = 1.9;

const scene::LightDesc ALTAR_LIGHT{
    .kind = scene::LightKind::Point, .color = {1.0, 0.3, 0.1}, .intensity = 120.0, .radius = 0.5};
constexpr double ALTAR_LIGHT_Z = 1.5;

}  // namespace

AltarAssembly AltarBuilder::build() {
    auto& factory = ctx_.factory;
    auto& host = ctx_.host;
    const uint32_t sides = ctx_.params.platform.sides;

    AltarAssembly altar;
    altar.anchor = host.create_empty_anchor(Pose3{}, "Altar");

    for (size_t i = 0; i < TIERS.size(); ++i) {
        const Tier& tier = TIERS[i];
        altar.tiers[i] = factory.cylinder(sides, tier.radius, tier.depth,
                                          Pose3::at({0.0, 0.0, tier.center_z}, HEX_ORIENTATION_OFFSET), tier.name);
        host.set_parent(ctx_.tagged(altar.tiers[i], tier.material), altar.anchor);
    }

    altar.fire_column = factory.cylinder(COLUMN_SIDES, COLUMN_RADIUS, COLUMN_DEPTH,
                                         Pose3::at({0.0, 0.0, COLUMN_CENTER_Z}), "Fire_Column");
    host.set_parent(ctx_.tagged(altar.fire_column, MaterialId::Fire), altar.anchor);

    altar.orb = factory.uv_sphere(ORB_SEGMENTS, ORB_RINGS, ORB_RADIUS, Pose3::at({0.0, 0.0, ORB_CENTER_Z}), "Soul_Orb");
    host.set_parent(ctx_.tagged(altar.orb, MaterialId::SoulOrb), altar.anchor);

    altar.light = host.create_light(ALTAR_LIGHT, Pose3::at({0.0, 0.0, ALTAR_LIGHT_Z}), "Altar_Light");
    host.set_parent(altar.light, altar.anchor);

    HEXFORGE_LOG_DEBUG(core::log_category::GENERATOR, "Altar: {} meshes, orb at z {}", altar.mesh_count(),
                       ORB_CENTER_Z);
    return altar;
}

}  // namespace hexforge::generation

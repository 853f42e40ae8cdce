// HexForge Generation
// pillar_builder.cpp - Brazier pillars standing on the pillar anchors

#include <fmt/format.h>
#include <hexforge/core/logger.hpp>
#include <hexforge/generation/deformation_ops.hpp>
#include <hexforge/generation/pillar_builder.hpp>

namespace hexforge::generation {

using scene::LightDesc;
using scene::LightKind;
using scene::MaterialId;

namespace {

// Fixed vertical recipe, in the anchor's frame
constexpr uint32_t PILLAR_SIDES = 12;
constexpr double BASE_RADIUS_SCALE = 1.5;
constexpr double BASE_DEPTH = 0.2;
constexpr double CAP_RADIUS_SCALE = 1.2;
constexpr double CAP_DEPTH = 0.12;

constexpr double BRAZIER_BOTTOM_RADIUS = 0.3;
constexpr double BRAZIER_TOP_RADIUS = 0.2;
constexpr double BRAZIER_DEPTH = 0.2;

constexpr uint32_t FIRE_SEGMENTS = 12;
constexpr uint32_t FIRE_RINGS = 8;
constexpr double FIRE_RADIUS = 0.15;
constexpr double FIRE_RADIUS_STEP = 0.03;  // Each stacked sphere is smaller
constexpr double FIRE_OFFSET = 0.25;       // Above the shaft top
constexpr double FIRE_SPACING = 0.1;

constexpr double CRYSTAL_RADIUS = 0.12;
constexpr double CRYSTAL_OFFSET = 0.55;
constexpr double CRYSTAL_WIDTH_SCALE = 0.7;
constexpr double CRYSTAL_HEIGHT_SCALE = 1.4;

const LightDesc CRYSTAL_LIGHT{.kind = LightKind::Point, .color = {0.6, 0.2, 0.9}, .intensity = 25.0, .radius = 0.5};
const LightDesc FIRE_LIGHT{.kind = LightKind::Point, .color = {1.0, 0.5, 0.2}, .intensity = 80.0, .radius = 0.3};

}  // namespace

std::vector<PillarAssembly> PillarBuilder::build(const std::vector<geometry::Point2>& anchors) {
    std::vector<PillarAssembly> pillars;
    pillars.reserve(anchors.size());
    for (uint32_t i = 0; i < anchors.size(); ++i) {
        pillars.push_back(build_one(anchors[i], i));
    }
    HEXFORGE_LOG_DEBUG(core::log_category::GENERATOR, "Built {} pillars at radius {}", pillars.size(),
                       ctx_.params.pillar_ring_radius());
    return pillars;
}

PillarAssembly PillarBuilder::build_one(const geometry::Point2& position, uint32_t index) {
    const auto& pillar = ctx_.params.pillars;
    const double h = pillar.height;
    auto& factory = ctx_.factory;
    auto& host = ctx_.host;

    PillarAssembly result;
    result.position = position;
    result.top_z = h;
    result.anchor = host.create_empty_anchor(Pose3::at({position.x, position.y, 0.0}), fmt::format("Pillar_{}", index));

    auto local = [](double z) { return Pose3::at({0.0, 0.0, z}); };
    auto attach = [&](NodeHandle node) {
        host.set_parent(node, result.anchor);
        return node;
    };

    // Shaft centered at half height, so the positive half tapers toward the top rim
    result.shaft = factory.cylinder(PILLAR_SIDES, pillar.radius, h, local(h * 0.5), fmt::format("Pillar_Shaft_{}", index));
    DeformationOps::taper_along_axis(host, result.shaft, Axis::Z, 1.0, pillar.taper_end_scale, h * 0.5);
    attach(ctx_.tagged(result.shaft, MaterialId::Obsidian));

    result.base = factory.cylinder(PILLAR_SIDES, pillar.radius * BASE_RADIUS_SCALE, BASE_DEPTH,
                                   local(BASE_DEPTH * 0.5), fmt::format("Pillar_Base_{}", index));
    attach(ctx_.tagged(result.base, MaterialId::Obsidian));

    result.cap = factory.cylinder(PILLAR_SIDES, pillar.radius * CAP_RADIUS_SCALE, CAP_DEPTH, local(h - CAP_DEPTH * 0.5),
                                  fmt::format("Pillar_Cap_{}", index));
    attach(ctx_.tagged(result.cap, MaterialId::Obsidian));

    result.brazier = factory.cone(PILLAR_SIDES, BRAZIER_BOTTOM_RADIUS, BRAZIER_TOP_RADIUS, BRAZIER_DEPTH,
                                  local(h + BRAZIER_DEPTH * 0.5), fmt::format("Brazier_{}", index));
    attach(ctx_.tagged(result.brazier, MaterialId::DarkMetal));

    for (uint32_t i = 0; i < pillar.fire_spheres; ++i) {
        const double radius = FIRE_RADIUS - FIRE_RADIUS_STEP * i;
        MeshHandle fire = factory.uv_sphere(FIRE_SEGMENTS, FIRE_RINGS, radius, local(h + FIRE_OFFSET + FIRE_SPACING * i),
                                            fmt::format("Fire_{}_{}", index, i));
        attach(ctx_.tagged(fire, MaterialId::Fire));
        result.fire.push_back(fire);
    }

    // Crystal floats above the topmost fire sphere
    const double crystal_z = h + CRYSTAL_OFFSET + FIRE_SPACING * (pillar.fire_spheres - 1);
    result.crystal = factory.icosphere(2, CRYSTAL_RADIUS, local(crystal_z), fmt::format("Crystal_{}", index));
    DeformationOps::elongate_along_axis(host, result.crystal, Axis::X, CRYSTAL_WIDTH_SCALE);
    DeformationOps::elongate_along_axis(host, result.crystal, Axis::Y, CRYSTAL_WIDTH_SCALE);
    DeformationOps::elongate_along_axis(host, result.crystal, Axis::Z, CRYSTAL_HEIGHT_SCALE);
    attach(ctx_.tagged(result.crystal, MaterialId::Crystal));

    result.crystal_light = attach(host.create_light(CRYSTAL_LIGHT, local(crystal_z), fmt::format("Crystal_Light_{}", index)));
    result.fire_light =
        attach(host.create_light(FIRE_LIGHT, local(h + FIRE_OFFSET + FIRE_SPACING), fmt::format("Fire_Light_{}", index)));

    return result;
}

}  // namespace hexforge::generation

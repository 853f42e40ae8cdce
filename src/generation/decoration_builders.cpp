// HexForge Generation
// decoration_builders.cpp - Edge spikes, skull/horn scatter and rune decals

#include <cmath>
#include <fmt/format.h>
#include <hexforge/core/logger.hpp>
#include <hexforge/generation/decoration_builders.hpp>
#include <hexforge/generation/deformation_ops.hpp>
#include <hexforge/geometry/radial_layout.hpp>

namespace hexforge::generation {

using geometry::HEX_ORIENTATION_OFFSET;
using geometry::RadialLayout;
using scene::MaterialId;

namespace {

constexpr uint32_t SPIKE_SIDES = 6;
constexpr double SPIKE_RADIUS = 0.12;
constexpr double SPIKE_DEPTH = 0.35;
constexpr double SPIKE_CENTER_Z = 0.18;

constexpr double SKULL_RADIUS = 0.08;
constexpr double SKULL_CENTER_Z = 0.05;
constexpr double SKULL_WIDTH_SCALE = 0.8;   // Y
constexpr double SKULL_HEIGHT_SCALE = 0.85;  // Z

constexpr uint32_t HORN_SIDES = 6;
constexpr double HORN_RADIUS = 0.06;
constexpr double HORN_DEPTH = 0.35;
constexpr double HORN_RING_RADIUS = 0.9;
constexpr double HORN_CENTER_Z = 0.55;
constexpr double HORN_LEAN = 0.4;  // Outward lean, radians

constexpr double RUNE_SIZE = 0.35;
constexpr uint32_t RUNE_CUTS = 2;
constexpr double RUNE_Z = 0.03;
constexpr double RUNE_JITTER = 0.05;
constexpr double RUNE_DEPTH_JITTER = RUNE_Z * 0.5;  // Keeps every glyph vertex above the floor top
constexpr double OUTER_RUNE_INSET = 0.6;
constexpr double MIDDLE_RUNE_INSET = 0.4;

}  // namespace

// ============================================================================
// Edge Spikes
// ============================================================================

std::vector<MeshHandle> EdgeSpikeBuilder::build() {
    const auto& params = ctx_.params;
    const auto points = RadialLayout::edge_points(params.platform.radius + RIM_OFFSET, params.platform.sides,
                                                  params.decorations.spikes_per_edge, HEX_ORIENTATION_OFFSET);

    std::vector<MeshHandle> spikes;
    spikes.reserve(points.size());
    for (const auto& point : points) {
        const Pose3 pose = Pose3::at({point.position.x, point.position.y, SPIKE_CENTER_Z}, point.edge_angle);
        MeshHandle spike = ctx_.factory.cone(SPIKE_SIDES, SPIKE_RADIUS, 0.0, SPIKE_DEPTH, pose,
                                             fmt::format("Edge_Spike_{}_{}", point.edge, point.index));
        spikes.push_back(ctx_.tagged(spike, MaterialId::Spike));
    }

    HEXFORGE_LOG_DEBUG(core::log_category::LAYOUT, "Placed {} edge spikes", spikes.size());
    return spikes;
}

// ============================================================================
// Scatter
// ============================================================================

ScatterResult ScatterBuilder::build() {
    ScatterResult result;
    result.skulls = build_skulls();
    result.horns = build_horns();
    return result;
}

std::vector<MeshHandle> ScatterBuilder::build_skulls() {
    const auto& deco = ctx_.params.decorations;

    std::vector<MeshHandle> skulls;
    skulls.reserve(deco.skull_count);
    for (uint32_t i = 0; i < deco.skull_count; ++i) {
        const auto p = RadialLayout::scatter_in_disk(deco.skull_scatter_radius, ctx_.rng);
        MeshHandle skull =
            ctx_.factory.icosphere(2, SKULL_RADIUS, Pose3::at({p.x, p.y, SKULL_CENTER_Z}), fmt::format("Skull_{}", i));
        DeformationOps::elongate_along_axis(ctx_.host, skull, Axis::Y, SKULL_WIDTH_SCALE);
        DeformationOps::elongate_along_axis(ctx_.host, skull, Axis::Z, SKULL_HEIGHT_SCALE);
        skulls.push_back(ctx_.tagged(skull, MaterialId::Bone));
    }

    HEXFORGE_LOG_DEBUG(core::log_category::LAYOUT, "Scattered {} skulls within radius {}", skulls.size(),
                       deco.skull_scatter_radius);
    return skulls;
}

std::vector<MeshHandle> ScatterBuilder::build_horns() {
    const uint32_t count = ctx_.params.decorations.horn_count;

    std::vector<MeshHandle> horns;
    horns.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        const double angle = RadialLayout::angle_at(i, count, HEX_ORIENTATION_OFFSET);
        const auto p = RadialLayout::polar(HORN_RING_RADIUS, angle);
        const Pose3 pose{.position = {p.x, p.y, HORN_CENTER_Z},
                         .rotation = {HORN_LEAN * std::sin(angle), -HORN_LEAN * std::cos(angle), 0.0}};
        MeshHandle horn = ctx_.factory.cone(HORN_SIDES, HORN_RADIUS, 0.0, HORN_DEPTH, pose, fmt::format("Horn_{}", i));
        horns.push_back(ctx_.tagged(horn, MaterialId::Spike));
    }
    return horns;
}

// ============================================================================
// Runes
// ============================================================================

std::vector<MeshHandle> RuneBuilder::build() {
    const auto& rings = ctx_.params.rings;
    const uint32_t per_ring = ctx_.params.decorations.runes_per_ring;

    struct RuneCircle {
        double radius;
        const char* label;
    };
    const RuneCircle circles[] = {
        {rings.outer_radius - OUTER_RUNE_INSET, "Outer"},
        {rings.middle_radius - MIDDLE_RUNE_INSET, "Middle"},
    };

    std::vector<MeshHandle> runes;
    runes.reserve(2 * static_cast<size_t>(per_ring));
    for (const auto& circle : circles) {
        for (uint32_t i = 0; i < per_ring; ++i) {
            const double angle = RadialLayout::angle_at(i, per_ring, HEX_ORIENTATION_OFFSET);
            const auto p = RadialLayout::polar(circle.radius, angle);
            MeshHandle rune = ctx_.factory.plane(RUNE_SIZE, RUNE_CUTS,
                                                 Pose3::at({p.x, p.y, RUNE_Z}, angle + geometry::HALF_PI),
                                                 fmt::format("Rune_{}_{}", circle.label, i));
            DeformationOps::jitter(ctx_.host, rune, Vec3(RUNE_JITTER, RUNE_JITTER, RUNE_DEPTH_JITTER), ctx_.rng);
            runes.push_back(ctx_.tagged(rune, MaterialId::Rune));
        }
    }

    HEXFORGE_LOG_DEBUG(core::log_category::GENERATOR, "Carved {} rune decals", runes.size());
    return runes;
}

}  // namespace hexforge::generation

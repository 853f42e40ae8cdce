// HexForge Generation
// curve_decorations.cpp - Chains, lava cracks and rune beams built from Bezier tubes

#include <fmt/format.h>
#include <hexforge/core/logger.hpp>
#include <hexforge/generation/curve_decorations.hpp>
#include <hexforge/geometry/radial_layout.hpp>

namespace hexforge::generation {

using geometry::RadialLayout;
using scene::MaterialId;

namespace {

constexpr double CHAIN_HEIGHT_FRACTION = 0.9;
constexpr double CHAIN_RADIUS = 0.035;

constexpr double CRACK_START_RADIUS = 1.0;
constexpr double CRACK_CONTROL_RADIUS = 2.5;
constexpr double CRACK_END_RADIUS = 4.0;
constexpr double CRACK_CONTROL_WOBBLE = 0.08;
constexpr double CRACK_END_WOBBLE = -0.05;
constexpr double CRACK_Z = 0.03;
constexpr double CRACK_RADIUS = 0.05;
constexpr uint32_t CRACK_SEGMENTS = 4;

constexpr double BEAM_START_Z = 0.05;
constexpr double BEAM_END_Z = 0.15;
constexpr double BEAM_RADIUS = 0.04;

Vec3 lift(const geometry::Point2& p, double z) {
    return Vec3(p.x, p.y, z);
}

}  // namespace

BezierSpec CurveDecorationBuilder::chain_curve(const geometry::Point2& from, const geometry::Point2& to, double z,
                                               double sag, uint32_t links) {
    const geometry::Point2 mid = (from + to) * 0.5;
    return BezierSpec{.start = lift(from, z),
                      .control = lift(mid, z - sag),
                      .end = lift(to, z),
                      .radius = CHAIN_RADIUS,
                      .sample_count = links};
}

BezierSpec CurveDecorationBuilder::crack_curve(double angle) {
    return BezierSpec{.start = lift(RadialLayout::polar(CRACK_START_RADIUS, angle), CRACK_Z),
                      .control = lift(RadialLayout::polar(CRACK_CONTROL_RADIUS, angle + CRACK_CONTROL_WOBBLE), CRACK_Z),
                      .end = lift(RadialLayout::polar(CRACK_END_RADIUS, angle + CRACK_END_WOBBLE), CRACK_Z),
                      .radius = CRACK_RADIUS,
                      .sample_count = CRACK_SEGMENTS};
}

BezierSpec CurveDecorationBuilder::beam_curve(const geometry::Point2& pillar) {
    const Vec3 start = lift(pillar, BEAM_START_Z);
    const Vec3 end(0.0, 0.0, BEAM_END_Z);
    return BezierSpec{.start = start, .control = (start + end) * 0.5, .end = end, .radius = BEAM_RADIUS, .sample_count = 1};
}

CurveGroup CurveDecorationBuilder::build_group(const BezierSpec& curve, const std::string& name,
                                               MaterialId material) {
    CurveTessellator tessellator(ctx_.factory);

    CurveGroup group;
    group.curve = curve;
    group.segments = tessellator.tessellate(curve, name + "_Segment");
    group.anchor = ctx_.host.create_empty_anchor(Pose3{}, name);
    for (MeshHandle segment : group.segments) {
        ctx_.host.set_parent(ctx_.tagged(segment, material), group.anchor);
    }
    return group;
}

std::vector<CurveGroup> CurveDecorationBuilder::build_chains(const std::vector<geometry::Point2>& pillar_anchors) {
    const auto& params = ctx_.params;
    const size_t n = pillar_anchors.size();
    const double z = params.pillars.height * CHAIN_HEIGHT_FRACTION;

    // Two pillars share a single chain instead of a doubled one
    const size_t chain_count = n == 2 ? 1 : n;

    std::vector<CurveGroup> chains;
    chains.reserve(chain_count);
    for (size_t i = 0; i < chain_count; ++i) {
        const auto curve = chain_curve(pillar_anchors[i], pillar_anchors[(i + 1) % n], z,
                                       params.decorations.chain_sag, params.decorations.chain_links);
        chains.push_back(build_group(curve, fmt::format("Chain_{}", i), MaterialId::DarkMetal));
    }

    HEXFORGE_LOG_DEBUG(core::log_category::GENERATOR, "Hung {} chains with {} links each", chains.size(),
                       params.decorations.chain_links);
    return chains;
}

std::vector<CurveGroup> CurveDecorationBuilder::build_lava_cracks() {
    const uint32_t count = ctx_.params.decorations.crack_count;

    std::vector<CurveGroup> cracks;
    cracks.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        const double angle = RadialLayout::angle_at(i, count, geometry::HEX_ORIENTATION_OFFSET);
        cracks.push_back(build_group(crack_curve(angle), fmt::format("Lava_Crack_{}", i), MaterialId::Lava));
    }

    HEXFORGE_LOG_DEBUG(core::log_category::GENERATOR, "Opened {} lava cracks", cracks.size());
    return cracks;
}

std::vector<CurveGroup> CurveDecorationBuilder::build_rune_beams(const std::vector<geometry::Point2>& pillar_anchors) {
    std::vector<CurveGroup> beams;
    beams.reserve(pillar_anchors.size());
    for (size_t i = 0; i < pillar_anchors.size(); ++i) {
        beams.push_back(build_group(beam_curve(pillar_anchors[i]), fmt::format("Rune_Beam_{}", i), MaterialId::Rune));
    }
    return beams;
}

}  // namespace hexforge::generation

// HexForge Generation
// curve_decorations.hpp - Chains, lava cracks and rune beams built from Bezier tubes

#pragma once

#include "build_context.hpp"
#include "curve_tessellator.hpp"

#include <hexforge/geometry/types.hpp>

#include <string>
#include <vector>

namespace hexforge::generation {

// The segments of one tessellated curve, parented to their own anchor
struct CurveGroup {
    NodeHandle anchor;
    BezierSpec curve;
    std::vector<MeshHandle> segments;
};

class CurveDecorationBuilder {
public:
    explicit CurveDecorationBuilder(const BuildContext& ctx) : ctx_(ctx) {}

    /// One sagging chain between each pair of neighbouring pillar tops
    std::vector<CurveGroup> build_chains(const std::vector<geometry::Point2>& pillar_anchors);

    /// crack_count glowing cracks radiating from the altar, with a slight angular wobble
    std::vector<CurveGroup> build_lava_cracks();

    /// One straight energy beam from every pillar base to the altar
    std::vector<CurveGroup> build_rune_beams(const std::vector<geometry::Point2>& pillar_anchors);

    // Curve recipes, exposed so callers and tests see the exact control points
    [[nodiscard]] static BezierSpec chain_curve(const geometry::Point2& from, const geometry::Point2& to, double z,
                                                double sag, uint32_t links);
    [[nodiscard]] static BezierSpec crack_curve(double angle);
    [[nodiscard]] static BezierSpec beam_curve(const geometry::Point2& pillar);

private:
    CurveGroup build_group(const BezierSpec& curve, const std::string& name, scene::MaterialId material);

    const BuildContext& ctx_;
};

}  // namespace hexforge::generation

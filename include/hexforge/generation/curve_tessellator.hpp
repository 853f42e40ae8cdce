// HexForge Generation
// curve_tessellator.hpp - Quadratic Bezier tubes approximated by cylinder chains

#pragma once

#include "primitive_factory.hpp"

#include <string_view>
#include <vector>

namespace hexforge::generation {

using geometry::Vec3;

/// Quadratic Bezier with a tube radius. sample_count is the number of
/// cylinder segments the curve is split into.
struct BezierSpec {
    Vec3 start{0.0};
    Vec3 control{0.0};
    Vec3 end{0.0};
    double radius = 0.05;
    uint32_t sample_count = 4;
    uint32_t sides = 8;
};

class CurveTessellator {
public:
    explicit CurveTessellator(PrimitiveFactory& factory);

    /// B(t) = (1-t)^2 P0 + 2(1-t)t P1 + t^2 P2, t in [0, 1]
    [[nodiscard]] static Vec3 evaluate(const BezierSpec& spec, double t);

    /// sample_count + 1 points at uniform t steps
    [[nodiscard]] static std::vector<Vec3> sample(const BezierSpec& spec);

    /// Pose placing a cylinder's local Z axis on the segment [a, b]:
    /// midpoint translation, yaw atan2(dy, dx) and a tilt of pi/2 - elevation.
    [[nodiscard]] static Pose3 segment_pose(const Vec3& a, const Vec3& b);

    /// One cylinder per segment, named "<name>_<index>". Curves with a
    /// zero-length segment are rejected with ParameterError before anything is created.
    std::vector<MeshHandle> tessellate(const BezierSpec& spec, std::string_view name);

private:
    PrimitiveFactory& factory_;
};

}  // namespace hexforge::generation

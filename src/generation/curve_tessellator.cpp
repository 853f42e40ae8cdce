// HexForge Generation
// curve_tessellator.cpp - Quadratic Bezier tubes approximated by cylinder chains

#include <cmath>
#include <fmt/format.h>
#include <hexforge/core/errors.hpp>
#include <hexforge/core/logger.hpp>
#include <hexforge/generation/curve_tessellator.hpp>

namespace hexforge::generation {

namespace {

constexpr double MIN_SEGMENT_LENGTH = 1e-9;

}  // namespace

CurveTessellator::CurveTessellator(PrimitiveFactory& factory) : factory_(factory) {}

Vec3 CurveTessellator::evaluate(const BezierSpec& spec, double t) {
    const double u = 1.0 - t;
    return u * u * spec.start + 2.0 * u * t * spec.control + t * t * spec.end;
}

std::vector<Vec3> CurveTessellator::sample(const BezierSpec& spec) {
    std::vector<Vec3> points;
    points.reserve(spec.sample_count + 1);
    for (uint32_t i = 0; i <= spec.sample_count; ++i) {
        points.push_back(evaluate(spec, static_cast<double>(i) / static_cast<double>(spec.sample_count)));
    }
    return points;
}

Pose3 CurveTessellator::segment_pose(const Vec3& a, const Vec3& b) {
    const Vec3 delta = b - a;
    const double horizontal = std::sqrt(delta.x * delta.x + delta.y * delta.y);
    const double yaw = std::atan2(delta.y, delta.x);
    const double elevation = std::atan2(delta.z, horizontal);

    return Pose3{.position = (a + b) * 0.5, .rotation = {0.0, geometry::HALF_PI - elevation, yaw}};
}

std::vector<MeshHandle> CurveTessellator::tessellate(const BezierSpec& spec, std::string_view name) {
    if (spec.sample_count < 1) {
        throw core::ParameterError(fmt::format("Curve '{}' needs at least one segment", name));
    }
    if (!(spec.radius > 0.0)) {
        throw core::ParameterError(fmt::format("Curve '{}' tube radius must be positive, got {}", name, spec.radius));
    }

    const auto points = sample(spec);
    for (size_t i = 0; i + 1 < points.size(); ++i) {
        if (glm::length(points[i + 1] - points[i]) < MIN_SEGMENT_LENGTH) {
            throw core::ParameterError(fmt::format("Curve '{}' segment {} has zero length", name, i));
        }
    }

    std::vector<MeshHandle> segments;
    segments.reserve(spec.sample_count);
    for (size_t i = 0; i + 1 < points.size(); ++i) {
        const double length = glm::length(points[i + 1] - points[i]);
        segments.push_back(factory_.cylinder(spec.sides, spec.radius, length, segment_pose(points[i], points[i + 1]),
                                             fmt::format("{}_{}", name, i)));
    }

    HEXFORGE_LOG_TRACE(core::log_category::GEOMETRY, "Tessellated curve '{}' into {} segments", name,
                       segments.size());
    return segments;
}

}  // namespace hexforge::generation

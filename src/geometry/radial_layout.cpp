// HexForge Geometry
// radial_layout.cpp - Angle/radius placement formulas

#include <cmath>
#include <hexforge/geometry/radial_layout.hpp>

namespace hexforge::geometry {

double RadialLayout::angle_at(uint32_t index, uint32_t count, double angle_offset) {
    return static_cast<double>(index) * TWO_PI / static_cast<double>(count) + angle_offset;
}

Point2 RadialLayout::polar(double radius, double angle) {
    return Point2(radius * std::cos(angle), radius * std::sin(angle));
}

std::vector<Point2> RadialLayout::ring_points(double radius, uint32_t count, double angle_offset) {
    std::vector<Point2> points;
    points.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        points.push_back(polar(radius, angle_at(i, count, angle_offset)));
    }
    return points;
}

std::vector<Point2> RadialLayout::polygon_vertices(double radius, uint32_t sides, double angle_offset) {
    return ring_points(radius, sides, angle_offset);
}

std::vector<Point2> RadialLayout::pillar_anchors(double radius, uint32_t count, double angle_offset) {
    return ring_points(radius, count, angle_offset);
}

std::vector<EdgePoint> RadialLayout::edge_points(double radius, uint32_t sides, uint32_t points_per_edge,
                                                 double angle_offset) {
    std::vector<EdgePoint> points;
    if (sides == 0 || points_per_edge == 0) {
        return points;
    }
    points.reserve(static_cast<size_t>(sides) * points_per_edge);

    const auto vertices = polygon_vertices(radius, sides, angle_offset);
    for (uint32_t edge = 0; edge < sides; ++edge) {
        const Point2& v1 = vertices[edge];
        const Point2& v2 = vertices[(edge + 1) % sides];
        const Point2 edge_vec = v2 - v1;
        const double edge_angle = std::atan2(edge_vec.y, edge_vec.x);

        for (uint32_t j = 0; j < points_per_edge; ++j) {
            const double t = (static_cast<double>(j) + 0.5) / static_cast<double>(points_per_edge);
            points.push_back(EdgePoint{v1 + edge_vec * t, edge_angle, edge, j});
        }
    }
    return points;
}

Point2 RadialLayout::scatter_in_disk(double radius, RandomEngine& rng) {
    std::uniform_real_distribution<double> angle_dist(0.0, TWO_PI);
    std::uniform_real_distribution<double> unit_dist(0.0, 1.0);

    // Drawn in two statements so the sample order is fixed
    const double angle = angle_dist(rng);
    const double r = radius * std::sqrt(unit_dist(rng));
    return polar(r, angle);
}

}  // namespace hexforge::geometry

// HexForge Geometry
// radial_layout.hpp - Angle/radius placement formulas for the platform layout

#pragma once

#include "types.hpp"

#include <cstdint>
#include <vector>

namespace hexforge::geometry {

// A point strictly inside one polygon edge, with the edge's direction
struct EdgePoint {
    Point2 position;
    double edge_angle = 0.0;  // atan2 of the edge vector, used as the decoration's yaw
    uint32_t edge = 0;
    uint32_t index = 0;       // Position along the edge, 0 = closest to the edge's first vertex
};

// Pure placement functions. None of them touch the scene.
class RadialLayout {
public:
    // Angle of the i-th of count points: i * 2pi / count + offset
    [[nodiscard]] static double angle_at(uint32_t index, uint32_t count, double angle_offset = 0.0);

    // count points evenly spaced on a circle in the XY plane.
    // count must be > 0; the caller guarantees it.
    [[nodiscard]] static std::vector<Point2> ring_points(double radius, uint32_t count, double angle_offset = 0.0);

    // Vertices of a regular polygon. The default offset gives the flat-sided
    // hexagon orientation used by the floor and rings.
    [[nodiscard]] static std::vector<Point2> polygon_vertices(double radius, uint32_t sides,
                                                              double angle_offset = HEX_ORIENTATION_OFFSET);

    // Pillar anchors: vertices of the unrotated polygon (offset 0 by default)
    [[nodiscard]] static std::vector<Point2> pillar_anchors(double radius, uint32_t count,
                                                            double angle_offset = 0.0);

    // points_per_edge points on every polygon edge at fractions (j + 0.5) / points_per_edge,
    // so no point ever lands on a vertex. Edges are ordered like polygon_vertices.
    [[nodiscard]] static std::vector<EdgePoint> edge_points(double radius, uint32_t sides, uint32_t points_per_edge,
                                                            double angle_offset = HEX_ORIENTATION_OFFSET);

    // Uniform-area sample inside a disk: angle ~ U(0, 2pi), r = R * sqrt(U(0, 1))
    [[nodiscard]] static Point2 scatter_in_disk(double radius, RandomEngine& rng);

    // Point at a given angle and distance from the origin
    [[nodiscard]] static Point2 polar(double radius, double angle);

private:
    RadialLayout() = delete;
};

}  // namespace hexforge::geometry

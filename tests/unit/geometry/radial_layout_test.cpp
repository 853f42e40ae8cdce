// HexForge Geometry Tests
// radial_layout_test.cpp - Angular placement formulas

#include <gtest/gtest.h>

#include <hexforge/geometry/radial_layout.hpp>

#include <cmath>

namespace hexforge::geometry {
namespace {

constexpr double EPS = 1e-9;

TEST(RadialLayoutTest, AngleAtSpacesEvenly) {
    EXPECT_NEAR(RadialLayout::angle_at(0, 6), 0.0, EPS);
    EXPECT_NEAR(RadialLayout::angle_at(1, 6), PI / 3.0, EPS);
    EXPECT_NEAR(RadialLayout::angle_at(3, 6, 0.25), PI + 0.25, EPS);
}

TEST(RadialLayoutTest, RingPointsLieOnCircle) {
    auto points = RadialLayout::ring_points(5.5, 12);
    ASSERT_EQ(points.size(), 12u);

    for (size_t i = 0; i < points.size(); ++i) {
        EXPECT_NEAR(glm::length(points[i]), 5.5, EPS);

        const Point2& next = points[(i + 1) % points.size()];
        const double step = std::atan2(points[i].x * next.y - points[i].y * next.x, glm::dot(points[i], next));
        EXPECT_NEAR(step, TWO_PI / 12.0, EPS);
    }
}

TEST(RadialLayoutTest, HexagonOffsetPutsEdgeMidpointOnPositiveX) {
    auto vertices = RadialLayout::polygon_vertices(1.0, 6);
    ASSERT_EQ(vertices.size(), 6u);

    // Edge from the last vertex (-30 deg) to the first (+30 deg) is vertical and crosses +X
    EXPECT_NEAR(vertices[0].x, vertices[5].x, EPS);
    EXPECT_NEAR(vertices[0].y, -vertices[5].y, EPS);
    EXPECT_GT(vertices[0].x, 0.0);
}

TEST(RadialLayoutTest, SixPillarAnchors) {
    auto anchors = RadialLayout::pillar_anchors(6.3, 6);
    ASSERT_EQ(anchors.size(), 6u);

    EXPECT_NEAR(anchors[0].x, 6.3, EPS);
    EXPECT_NEAR(anchors[0].y, 0.0, EPS);
    EXPECT_NEAR(anchors[1].x, 6.3 * 0.5, EPS);
    EXPECT_NEAR(anchors[1].y, 6.3 * std::sqrt(3.0) / 2.0, EPS);
    EXPECT_NEAR(anchors[3].x, -6.3, EPS);

    for (const auto& anchor : anchors) {
        EXPECT_NEAR(glm::length(anchor), 6.3, EPS);
    }
}

TEST(RadialLayoutTest, EdgePointsUseHalfStepFractions) {
    auto points = RadialLayout::edge_points(7.05, 6, 3);
    ASSERT_EQ(points.size(), 18u);

    auto vertices = RadialLayout::polygon_vertices(7.05, 6);
    for (const auto& point : points) {
        const Point2& v1 = vertices[point.edge];
        const Point2& v2 = vertices[(point.edge + 1) % 6];
        const double t = (static_cast<double>(point.index) + 0.5) / 3.0;
        const Point2 expected = v1 + (v2 - v1) * t;

        EXPECT_NEAR(point.position.x, expected.x, EPS);
        EXPECT_NEAR(point.position.y, expected.y, EPS);
        EXPECT_NEAR(point.edge_angle, std::atan2(v2.y - v1.y, v2.x - v1.x), EPS);

        // Never on a vertex
        for (const auto& vertex : vertices) {
            EXPECT_GT(glm::length(point.position - vertex), 0.1);
        }
    }
}

TEST(RadialLayoutTest, EdgePointsMiddleOfEdgeOnApothem) {
    auto points = RadialLayout::edge_points(2.0, 6, 1);
    ASSERT_EQ(points.size(), 6u);

    const double apothem = 2.0 * std::cos(PI / 6.0);
    for (const auto& point : points) {
        EXPECT_NEAR(glm::length(point.position), apothem, EPS);
    }
}

TEST(RadialLayoutTest, EdgePointsEmptyForZeroCount) {
    EXPECT_TRUE(RadialLayout::edge_points(1.0, 6, 0).empty());
    EXPECT_TRUE(RadialLayout::edge_points(1.0, 0, 3).empty());
}

TEST(RadialLayoutTest, ScatterStaysInsideDisk) {
    RandomEngine rng(42);
    for (int i = 0; i < 1000; ++i) {
        const Point2 p = RadialLayout::scatter_in_disk(4.8, rng);
        EXPECT_LE(glm::length(p), 4.8 + EPS);
    }
}

TEST(RadialLayoutTest, ScatterIsDeterministicForSeed) {
    RandomEngine a(7);
    RandomEngine b(7);
    for (int i = 0; i < 16; ++i) {
        const Point2 pa = RadialLayout::scatter_in_disk(3.0, a);
        const Point2 pb = RadialLayout::scatter_in_disk(3.0, b);
        EXPECT_EQ(pa, pb);
    }
}

TEST(RadialLayoutTest, ScatterCoversOuterAnnulus) {
    // Area-uniform sampling puts about a quarter of the samples beyond r = R * sqrt(3) / 2
    RandomEngine rng(1234);
    int outer = 0;
    const int samples = 4000;
    for (int i = 0; i < samples; ++i) {
        if (glm::length(RadialLayout::scatter_in_disk(1.0, rng)) > std::sqrt(3.0) / 2.0) {
            ++outer;
        }
    }
    EXPECT_NEAR(static_cast<double>(outer) / samples, 0.25, 0.04);
}

}  // namespace
}  // namespace hexforge::geometry

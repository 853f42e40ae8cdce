// HexForge Scene Tests
// primitive_mesh_test.cpp - Triangle mesh generation for primitive kinds

#include <gtest/gtest.h>

#include <hexforge/core/errors.hpp>
#include <hexforge/scene/primitive_mesh.hpp>

#include <cmath>
#include <map>
#include <utility>

namespace hexforge::scene {
namespace {

using geometry::PI;

// Every directed edge must appear once, paired with its reverse
bool is_closed_manifold(const MeshData& mesh) {
    std::map<std::pair<uint32_t, uint32_t>, int> edges;
    for (size_t f = 0; f < mesh.indices.size(); f += 3) {
        for (size_t k = 0; k < 3; ++k) {
            const uint32_t a = mesh.indices[f + k];
            const uint32_t b = mesh.indices[f + (k + 1) % 3];
            if (++edges[{a, b}] > 1) {
                return false;
            }
        }
    }
    for (const auto& [edge, count] : edges) {
        if (!edges.contains({edge.second, edge.first})) {
            return false;
        }
    }
    return true;
}

double signed_volume(const MeshData& mesh) {
    double volume = 0.0;
    for (size_t f = 0; f < mesh.indices.size(); f += 3) {
        const Vec3& a = mesh.vertices[mesh.indices[f]];
        const Vec3& b = mesh.vertices[mesh.indices[f + 1]];
        const Vec3& c = mesh.vertices[mesh.indices[f + 2]];
        volume += glm::dot(a, glm::cross(b, c)) / 6.0;
    }
    return volume;
}

double polygon_area(uint32_t sides, double radius) {
    return 0.5 * sides * radius * radius * std::sin(geometry::TWO_PI / sides);
}

// ============================================================================
// Cylinder / Cone
// ============================================================================

TEST(PrimitiveMeshTest, HexPrismCounts) {
    auto mesh = PrimitiveMesh::cone(6, 1.0, 1.0, 0.5);
    EXPECT_EQ(mesh.vertex_count(), 12u);
    EXPECT_EQ(mesh.triangle_count(), 20u);  // 12 wall + 2 * 4 cap
    EXPECT_TRUE(is_closed_manifold(mesh));
}

TEST(PrimitiveMeshTest, PrismCapsAtHalfDepth) {
    auto mesh = PrimitiveMesh::cone(12, 0.35, 0.35, 3.0);
    auto bounds = geometry::compute_bounds(mesh.vertices);
    EXPECT_NEAR(bounds.min.z, -1.5, 1e-12);
    EXPECT_NEAR(bounds.max.z, 1.5, 1e-12);

    // First ring vertex on +X
    EXPECT_NEAR(mesh.vertices[0].x, 0.35, 1e-12);
    EXPECT_NEAR(mesh.vertices[0].y, 0.0, 1e-12);
}

TEST(PrimitiveMeshTest, PrismVolumeIsOutward) {
    auto mesh = PrimitiveMesh::cone(6, 2.0, 2.0, 0.5);
    EXPECT_NEAR(signed_volume(mesh), polygon_area(6, 2.0) * 0.5, 1e-9);
}

TEST(PrimitiveMeshTest, ConeWithApex) {
    auto mesh = PrimitiveMesh::cone(6, 0.12, 0.0, 0.35);
    EXPECT_EQ(mesh.vertex_count(), 7u);
    EXPECT_EQ(mesh.triangle_count(), 10u);  // 6 sides + 4 cap
    EXPECT_TRUE(is_closed_manifold(mesh));
    EXPECT_NEAR(signed_volume(mesh), polygon_area(6, 0.12) * 0.35 / 3.0, 1e-12);
}

TEST(PrimitiveMeshTest, InvertedConeWithApex) {
    auto mesh = PrimitiveMesh::cone(8, 0.0, 0.5, 1.0);
    EXPECT_EQ(mesh.vertex_count(), 9u);
    EXPECT_TRUE(is_closed_manifold(mesh));
    EXPECT_GT(signed_volume(mesh), 0.0);
}

TEST(PrimitiveMeshTest, TruncatedCone) {
    auto mesh = PrimitiveMesh::cone(16, 0.3, 0.2, 0.2);
    EXPECT_EQ(mesh.vertex_count(), 32u);
    EXPECT_TRUE(is_closed_manifold(mesh));
}

TEST(PrimitiveMeshTest, InvalidConeThrows) {
    EXPECT_THROW((void)PrimitiveMesh::cone(2, 1.0, 1.0, 1.0), core::HostOperationError);
    EXPECT_THROW((void)PrimitiveMesh::cone(6, 1.0, 1.0, 0.0), core::HostOperationError);
    EXPECT_THROW((void)PrimitiveMesh::cone(6, 0.0, 0.0, 1.0), core::HostOperationError);
    EXPECT_THROW((void)PrimitiveMesh::cone(6, -1.0, 1.0, 1.0), core::HostOperationError);
}

// ============================================================================
// Spheres
// ============================================================================

TEST(PrimitiveMeshTest, IcosphereCounts) {
    auto base = PrimitiveMesh::icosphere(0, 1.0);
    EXPECT_EQ(base.vertex_count(), 12u);
    EXPECT_EQ(base.triangle_count(), 20u);

    auto mesh = PrimitiveMesh::icosphere(2, 0.12);
    EXPECT_EQ(mesh.vertex_count(), 162u);
    EXPECT_EQ(mesh.triangle_count(), 320u);
    EXPECT_TRUE(is_closed_manifold(mesh));
}

TEST(PrimitiveMeshTest, IcosphereVerticesOnSphere) {
    auto mesh = PrimitiveMesh::icosphere(3, 0.08);
    for (const auto& v : mesh.vertices) {
        EXPECT_NEAR(glm::length(v), 0.08, 1e-12);
    }
    const double sphere = 4.0 / 3.0 * PI * 0.08 * 0.08 * 0.08;
    EXPECT_NEAR(std::abs(signed_volume(mesh)) / sphere, 1.0, 0.03);
}

TEST(PrimitiveMeshTest, IcosphereSubdivisionLimit) {
    EXPECT_THROW((void)PrimitiveMesh::icosphere(PrimitiveMesh::MAX_ICOSPHERE_SUBDIVISIONS, 1.0),
                 core::HostOperationError);
    EXPECT_THROW((void)PrimitiveMesh::icosphere(1, 0.0), core::HostOperationError);
}

TEST(PrimitiveMeshTest, UvSphereCounts) {
    auto mesh = PrimitiveMesh::uv_sphere(12, 8, 0.15);
    EXPECT_EQ(mesh.vertex_count(), 2u + 12u * 7u);
    EXPECT_EQ(mesh.triangle_count(), 2u * 12u * 7u);
    EXPECT_TRUE(is_closed_manifold(mesh));
    EXPECT_GT(signed_volume(mesh), 0.0);

    for (const auto& v : mesh.vertices) {
        EXPECT_NEAR(glm::length(v), 0.15, 1e-12);
    }
}

TEST(PrimitiveMeshTest, UvSphereRejectsTooFewSegments) {
    EXPECT_THROW((void)PrimitiveMesh::uv_sphere(2, 8, 1.0), core::HostOperationError);
    EXPECT_THROW((void)PrimitiveMesh::uv_sphere(8, 1, 1.0), core::HostOperationError);
}

// ============================================================================
// Plane
// ============================================================================

TEST(PrimitiveMeshTest, PlaneGrid) {
    auto mesh = PrimitiveMesh::plane(0.35, 2);
    EXPECT_EQ(mesh.vertex_count(), 16u);
    EXPECT_EQ(mesh.triangle_count(), 18u);

    auto bounds = geometry::compute_bounds(mesh.vertices);
    EXPECT_NEAR(bounds.size().x, 0.35, 1e-12);
    EXPECT_NEAR(bounds.size().y, 0.35, 1e-12);
    EXPECT_NEAR(bounds.size().z, 0.0, 1e-12);
}

TEST(PrimitiveMeshTest, PlaneFacesUp) {
    auto mesh = PrimitiveMesh::plane(1.0, 0);
    ASSERT_EQ(mesh.triangle_count(), 2u);
    for (size_t f = 0; f < mesh.indices.size(); f += 3) {
        const Vec3& a = mesh.vertices[mesh.indices[f]];
        const Vec3& b = mesh.vertices[mesh.indices[f + 1]];
        const Vec3& c = mesh.vertices[mesh.indices[f + 2]];
        EXPECT_GT(glm::cross(b - a, c - a).z, 0.0);
    }
}

// ============================================================================
// Bevel and Annulus
// ============================================================================

TEST(PrimitiveMeshTest, BeveledPrismKeepsExtent) {
    PrismProfile prism{.sides = 6, .radius = 7.0, .depth = 0.5};
    auto mesh = PrimitiveMesh::beveled_prism(prism, 0.08, 2);

    EXPECT_EQ(mesh.vertex_count(), 6u * 6u);
    EXPECT_TRUE(is_closed_manifold(mesh));

    auto bounds = geometry::compute_bounds(mesh.vertices);
    EXPECT_NEAR(bounds.min.z, -0.25, 1e-12);
    EXPECT_NEAR(bounds.max.z, 0.25, 1e-12);
    EXPECT_NEAR(bounds.max.x, 7.0, 1e-12);

    // Rounding removes a little material
    const double full = polygon_area(6, 7.0) * 0.5;
    const double volume = signed_volume(mesh);
    EXPECT_LT(volume, full);
    EXPECT_GT(volume, full * 0.97);
}

TEST(PrimitiveMeshTest, BevelWiderThanHalfDepthThrows) {
    PrismProfile prism{.sides = 6, .radius = 7.0, .depth = 0.5};
    EXPECT_THROW((void)PrimitiveMesh::beveled_prism(prism, 0.25, 2), core::HostOperationError);
    EXPECT_THROW((void)PrimitiveMesh::beveled_prism(prism, 0.0, 2), core::HostOperationError);
    EXPECT_THROW((void)PrimitiveMesh::beveled_prism(prism, 0.1, 0), core::HostOperationError);
}

TEST(PrimitiveMeshTest, HexAnnulusVolume) {
    PrismProfile outer{.sides = 6, .radius = 5.5, .depth = 0.025};
    PrismProfile inner{.sides = 6, .radius = 5.2, .depth = 0.105};
    auto mesh = PrimitiveMesh::annulus(outer, inner, 0.0);

    EXPECT_EQ(mesh.vertex_count(), 24u);
    EXPECT_EQ(mesh.triangle_count(), 48u);
    EXPECT_TRUE(is_closed_manifold(mesh));

    const double expected = (polygon_area(6, 5.5) - polygon_area(6, 5.2)) * 0.025;
    EXPECT_NEAR(signed_volume(mesh), expected, 1e-9);
}

TEST(PrimitiveMeshTest, CircularAnnulusWithRotatedInnerLoop) {
    PrismProfile outer{.sides = 48, .radius = 1.8, .depth = 0.025};
    PrismProfile inner{.sides = 48, .radius = 1.5, .depth = 0.105};
    auto mesh = PrimitiveMesh::annulus(outer, inner, 0.05);

    EXPECT_TRUE(is_closed_manifold(mesh));
    const double expected = (polygon_area(48, 1.8) - polygon_area(48, 1.5)) * 0.025;
    EXPECT_NEAR(signed_volume(mesh), expected, 1e-9);
}

TEST(PrimitiveMeshTest, MixedSideCountAnnulus) {
    PrismProfile outer{.sides = 6, .radius = 2.0, .depth = 0.2};
    PrismProfile inner{.sides = 32, .radius = 1.0, .depth = 0.4};
    auto mesh = PrimitiveMesh::annulus(outer, inner, 0.0);

    EXPECT_EQ(mesh.triangle_count(), 4u * (6u + 32u));
    EXPECT_TRUE(is_closed_manifold(mesh));
    const double expected = (polygon_area(6, 2.0) - polygon_area(32, 1.0)) * 0.2;
    EXPECT_NEAR(signed_volume(mesh), expected, 1e-9);
}

TEST(PrimitiveMeshTest, BuildDispatchesOnKind) {
    EXPECT_EQ(PrimitiveMesh::build(PrimitiveKind::Cylinder, PrimitiveParams::cylinder(6, 1.0, 1.0)).vertex_count(),
              12u);
    EXPECT_EQ(PrimitiveMesh::build(PrimitiveKind::Cone, PrimitiveParams::cone(6, 1.0, 0.0, 1.0)).vertex_count(), 7u);
    EXPECT_EQ(PrimitiveMesh::build(PrimitiveKind::Icosphere, PrimitiveParams::icosphere(1, 1.0)).vertex_count(), 42u);
    EXPECT_EQ(PrimitiveMesh::build(PrimitiveKind::UvSphere, PrimitiveParams::uv_sphere(8, 4, 1.0)).vertex_count(),
              26u);
    EXPECT_EQ(PrimitiveMesh::build(PrimitiveKind::Plane, PrimitiveParams::plane(1.0, 1)).vertex_count(), 9u);
    EXPECT_STREQ(primitive_kind_name(PrimitiveKind::UvSphere), "uv_sphere");
}

}  // namespace
}  // namespace hexforge::scene

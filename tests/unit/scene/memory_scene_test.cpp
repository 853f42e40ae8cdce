// HexForge Scene Tests
// memory_scene_test.cpp - In-process scene host contract

#include <gtest/gtest.h>

#include <hexforge/core/errors.hpp>
#include <hexforge/scene/memory_scene.hpp>

namespace hexforge::scene {
namespace {

using geometry::HEX_ORIENTATION_OFFSET;

class MemorySceneTest : public ::testing::Test {
protected:
    MemoryScene scene_;

    MeshHandle hex_prism(double radius, double depth, double z = 0.0, double yaw = HEX_ORIENTATION_OFFSET,
                         std::string_view name = "Prism") {
        return scene_.create_primitive(PrimitiveKind::Cylinder, PrimitiveParams::cylinder(6, radius, depth),
                                       Pose3::at(Vec3(0.0, 0.0, z), yaw), name);
    }
};

// ============================================================================
// Creation and Queries
// ============================================================================

TEST_F(MemorySceneTest, HandlesAreUniqueAndValid) {
    auto a = hex_prism(1.0, 1.0);
    auto b = hex_prism(1.0, 1.0);
    auto light = scene_.create_light(LightDesc{}, Pose3{}, "Light");
    auto empty = scene_.create_empty_anchor(Pose3{}, "Anchor");

    EXPECT_TRUE(a.valid());
    EXPECT_NE(a, b);
    EXPECT_NE(light, empty);
    EXPECT_EQ(scene_.kind_of(a), NodeKind::Mesh);
    EXPECT_EQ(scene_.kind_of(light), NodeKind::Light);
    EXPECT_EQ(scene_.kind_of(empty), NodeKind::Empty);
    EXPECT_EQ(scene_.node_count(), 4u);
    EXPECT_EQ(scene_.mesh_nodes().size(), 2u);
}

TEST_F(MemorySceneTest, CylinderRecordsPrismProfile) {
    auto mesh = hex_prism(7.0, 0.5, -0.25, HEX_ORIENTATION_OFFSET, "Floor");
    const auto& node = scene_.node(mesh);

    ASSERT_TRUE(node.prism.has_value());
    EXPECT_EQ(node.prism->sides, 6u);
    EXPECT_DOUBLE_EQ(node.prism->radius, 7.0);
    EXPECT_EQ(node.name, "Floor");
    EXPECT_EQ(scene_.find_by_name("Floor"), &node);
}

TEST_F(MemorySceneTest, UnknownHandleThrows) {
    NodeHandle bogus{999};
    EXPECT_FALSE(scene_.exists(bogus));
    EXPECT_EQ(scene_.find(bogus), nullptr);
    EXPECT_THROW((void)scene_.node(bogus), core::HostOperationError);
    EXPECT_THROW((void)scene_.kind_of(bogus), core::HostOperationError);
    EXPECT_THROW(scene_.tag_material(bogus, MaterialId::Bone), core::HostOperationError);
}

TEST_F(MemorySceneTest, MeshOperationsRejectNonMeshNodes) {
    auto light = scene_.create_light(LightDesc{}, Pose3{}, "Light");
    EXPECT_THROW((void)scene_.get_vertex_buffer(light), core::HostOperationError);
    EXPECT_THROW(scene_.set_smooth_shading(light, true), core::HostOperationError);
}

TEST_F(MemorySceneTest, TagMaterialAndShading) {
    auto mesh = hex_prism(1.0, 1.0);
    scene_.tag_material(mesh, MaterialId::Obsidian);
    scene_.set_smooth_shading(mesh, true);

    EXPECT_EQ(scene_.node(mesh).material, MaterialId::Obsidian);
    EXPECT_TRUE(scene_.node(mesh).smooth_shading);
}

// ============================================================================
// Boolean Difference
// ============================================================================

TEST_F(MemorySceneTest, BooleanCarvesHexRing) {
    auto ring = hex_prism(5.5, 0.025, 0.0125);
    auto cutter = hex_prism(5.2, 0.105, 0.0125);

    EXPECT_EQ(scene_.boolean_difference(ring, cutter), ring);

    const auto& node = scene_.node(ring);
    EXPECT_FALSE(node.prism.has_value());
    EXPECT_EQ(node.mesh.vertex_count(), 24u);
    EXPECT_TRUE(scene_.exists(cutter));  // The caller still owns the cutter
}

TEST_F(MemorySceneTest, BooleanWithCircularCutterUsesApothemLimit) {
    auto ring = hex_prism(2.0, 0.2);
    auto fits = scene_.create_primitive(PrimitiveKind::Cylinder, PrimitiveParams::cylinder(32, 1.7, 0.4),
                                        Pose3::at(Vec3(0.0)), "Fits");
    EXPECT_NO_THROW(scene_.boolean_difference(ring, fits));

    auto ring2 = hex_prism(2.0, 0.2);
    auto too_wide = scene_.create_primitive(PrimitiveKind::Cylinder, PrimitiveParams::cylinder(32, 1.8, 0.4),
                                            Pose3::at(Vec3(0.0)), "TooWide");
    EXPECT_THROW(scene_.boolean_difference(ring2, too_wide), core::GeometryDegeneracyError);
}

TEST_F(MemorySceneTest, BooleanRejectsCoplanarCaps) {
    auto ring = hex_prism(5.5, 0.025);
    auto cutter = hex_prism(5.2, 0.025);
    EXPECT_THROW(scene_.boolean_difference(ring, cutter), core::GeometryDegeneracyError);
}

TEST_F(MemorySceneTest, BooleanRejectsOffsetCutter) {
    auto ring = hex_prism(5.5, 0.025);
    auto cutter = scene_.create_primitive(PrimitiveKind::Cylinder, PrimitiveParams::cylinder(6, 5.2, 0.1),
                                          Pose3::at(Vec3(0.3, 0.0, 0.0), HEX_ORIENTATION_OFFSET), "Offset");
    EXPECT_THROW(scene_.boolean_difference(ring, cutter), core::GeometryDegeneracyError);
}

TEST_F(MemorySceneTest, BooleanRejectsOversizedCutter) {
    auto ring = hex_prism(5.5, 0.025);
    auto cutter = hex_prism(5.5, 0.1);
    EXPECT_THROW(scene_.boolean_difference(ring, cutter), core::GeometryDegeneracyError);
}

TEST_F(MemorySceneTest, BooleanRejectsNonPrismOperands) {
    auto ring = hex_prism(5.5, 0.025);
    auto sphere = scene_.create_primitive(PrimitiveKind::Icosphere, PrimitiveParams::icosphere(1, 1.0),
                                          Pose3{}, "Sphere");
    EXPECT_THROW(scene_.boolean_difference(ring, sphere), core::GeometryDegeneracyError);
    EXPECT_THROW(scene_.boolean_difference(ring, ring), core::HostOperationError);
}

TEST_F(MemorySceneTest, BooleanRejectsCarvedMesh) {
    auto ring = hex_prism(5.5, 0.025);
    auto cutter = hex_prism(5.2, 0.1);
    scene_.boolean_difference(ring, cutter);

    auto second = hex_prism(4.0, 0.1);
    EXPECT_THROW(scene_.boolean_difference(ring, second), core::GeometryDegeneracyError);
}

TEST_F(MemorySceneTest, BooleanRejectsTiltedPrism) {
    auto ring = hex_prism(5.5, 0.025);
    auto cutter = scene_.create_primitive(PrimitiveKind::Cylinder, PrimitiveParams::cylinder(6, 5.0, 0.1),
                                          Pose3{Vec3(0.0), Vec3(0.2, 0.0, 0.0), Vec3(1.0)}, "Tilted");
    EXPECT_THROW(scene_.boolean_difference(ring, cutter), core::GeometryDegeneracyError);
}

// ============================================================================
// Bevel and Vertex Buffers
// ============================================================================

TEST_F(MemorySceneTest, BevelReplacesPrismMesh) {
    auto floor = hex_prism(7.0, 0.5, -0.25);
    scene_.bevel_edges(floor, 0.08, 2);

    EXPECT_EQ(scene_.node(floor).mesh.vertex_count(), 36u);
    EXPECT_FALSE(scene_.node(floor).prism.has_value());
}

TEST_F(MemorySceneTest, DegenerateBevelThrows) {
    auto floor = hex_prism(7.0, 0.5);
    EXPECT_THROW(scene_.bevel_edges(floor, 0.3, 2), core::GeometryDegeneracyError);
    EXPECT_THROW(scene_.bevel_edges(floor, -0.1, 2), core::GeometryDegeneracyError);

    auto sphere = scene_.create_primitive(PrimitiveKind::UvSphere, PrimitiveParams::uv_sphere(8, 4, 1.0), Pose3{},
                                          "Sphere");
    EXPECT_THROW(scene_.bevel_edges(sphere, 0.05, 1), core::HostOperationError);
}

TEST_F(MemorySceneTest, VertexBufferRoundTrip) {
    auto mesh = hex_prism(1.0, 1.0);
    auto vertices = scene_.get_vertex_buffer(mesh);
    ASSERT_EQ(vertices.size(), 12u);

    for (auto& v : vertices) {
        v.z *= 2.0;
    }
    scene_.set_vertex_buffer(mesh, vertices);

    EXPECT_EQ(scene_.get_vertex_buffer(mesh), vertices);
    EXPECT_FALSE(scene_.node(mesh).prism.has_value());
}

TEST_F(MemorySceneTest, VertexBufferCountMismatchThrows) {
    auto mesh = hex_prism(1.0, 1.0);
    auto vertices = scene_.get_vertex_buffer(mesh);
    vertices.pop_back();
    EXPECT_THROW(scene_.set_vertex_buffer(mesh, vertices), core::HostOperationError);
}

// ============================================================================
// Hierarchy
// ============================================================================

TEST_F(MemorySceneTest, ParentingIsOneShot) {
    auto anchor = scene_.create_empty_anchor(Pose3{}, "Anchor");
    auto other = scene_.create_empty_anchor(Pose3{}, "Other");
    auto mesh = hex_prism(1.0, 1.0);

    scene_.set_parent(mesh, anchor);
    EXPECT_EQ(scene_.node(mesh).parent, anchor);
    EXPECT_EQ(scene_.node(anchor).children.size(), 1u);

    EXPECT_THROW(scene_.set_parent(mesh, other), core::HostOperationError);
    EXPECT_THROW(scene_.set_parent(anchor, anchor), core::HostOperationError);
}

TEST_F(MemorySceneTest, ParentingCycleThrows) {
    auto a = scene_.create_empty_anchor(Pose3{}, "A");
    auto b = scene_.create_empty_anchor(Pose3{}, "B");
    scene_.set_parent(b, a);
    EXPECT_THROW(scene_.set_parent(a, b), core::HostOperationError);
}

TEST_F(MemorySceneTest, TopLevelNodesExcludeChildren) {
    auto root = scene_.create_empty_anchor(Pose3{}, "Root");
    auto a = hex_prism(1.0, 1.0);
    auto b = hex_prism(1.0, 1.0);
    scene_.set_parent(a, root);

    auto top = scene_.top_level_nodes();
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0], root);
    EXPECT_EQ(top[1], b);
}

TEST_F(MemorySceneTest, WorldTransformComposesParentPose) {
    auto anchor = scene_.create_empty_anchor(Pose3::at(Vec3(6.3, 0.0, 0.0)), "Pillar");
    auto part = scene_.create_primitive(PrimitiveKind::Cylinder, PrimitiveParams::cylinder(12, 0.35, 3.0),
                                        Pose3::at(Vec3(0.0, 0.0, 1.5)), "Shaft");
    scene_.set_parent(part, anchor);

    const auto world = scene_.world_transform(part);
    EXPECT_NEAR(world[3].x, 6.3, 1e-12);
    EXPECT_NEAR(world[3].z, 1.5, 1e-12);
}

TEST_F(MemorySceneTest, DestroyRemovesSubtree) {
    auto root = scene_.create_empty_anchor(Pose3{}, "Root");
    auto anchor = scene_.create_empty_anchor(Pose3{}, "Anchor");
    auto mesh = hex_prism(1.0, 1.0);
    auto light = scene_.create_light(LightDesc{}, Pose3{}, "Light");
    scene_.set_parent(anchor, root);
    scene_.set_parent(mesh, anchor);
    scene_.set_parent(light, anchor);
    EXPECT_EQ(scene_.descendant_count(root), 3u);

    scene_.destroy(anchor);

    EXPECT_TRUE(scene_.exists(root));
    EXPECT_FALSE(scene_.exists(anchor));
    EXPECT_FALSE(scene_.exists(mesh));
    EXPECT_FALSE(scene_.exists(light));
    EXPECT_TRUE(scene_.node(root).children.empty());
    EXPECT_THROW(scene_.destroy(anchor), core::HostOperationError);
}

TEST_F(MemorySceneTest, StatsCountNodesAndGeometry) {
    hex_prism(1.0, 1.0);
    (void)scene_.create_light(LightDesc{}, Pose3{}, "Light");
    (void)scene_.create_empty_anchor(Pose3{}, "Anchor");

    auto stats = scene_.stats();
    EXPECT_EQ(stats.mesh_count, 1u);
    EXPECT_EQ(stats.light_count, 1u);
    EXPECT_EQ(stats.empty_count, 1u);
    EXPECT_EQ(stats.vertex_count, 12u);
    EXPECT_EQ(stats.triangle_count, 20u);
}

TEST_F(MemorySceneTest, ClearNeverReusesIds) {
    auto before = hex_prism(1.0, 1.0);
    scene_.clear();
    EXPECT_EQ(scene_.node_count(), 0u);

    auto after = hex_prism(1.0, 1.0);
    EXPECT_NE(before, after);
    EXPECT_FALSE(scene_.exists(before));
}

// ============================================================================
// ScopedNode
// ============================================================================

TEST_F(MemorySceneTest, ScopedNodeDestroysOnExit) {
    NodeHandle handle;
    {
        ScopedNode cutter(scene_, hex_prism(1.0, 1.0));
        handle = cutter.get();
        EXPECT_TRUE(scene_.exists(handle));
    }
    EXPECT_FALSE(scene_.exists(handle));
}

TEST_F(MemorySceneTest, ScopedNodeReleaseKeepsNode) {
    NodeHandle handle;
    {
        ScopedNode node(scene_, hex_prism(1.0, 1.0));
        handle = node.release();
    }
    EXPECT_TRUE(scene_.exists(handle));
}

TEST_F(MemorySceneTest, ScopedNodeToleratesVanishedNode) {
    auto handle = hex_prism(1.0, 1.0);
    {
        ScopedNode node(scene_, handle);
        scene_.destroy(handle);
    }
    EXPECT_FALSE(scene_.exists(handle));
}

}  // namespace
}  // namespace hexforge::scene

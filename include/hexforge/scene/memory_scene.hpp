// HexForge Scene
// memory_scene.hpp - In-process scene host backed by a node table

#pragma once

#include "primitive_mesh.hpp"
#include "scene_host.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hexforge::scene {

// Snapshot of one scene node. Mesh fields are meaningful for NodeKind::Mesh,
// light fields for NodeKind::Light.
struct SceneNode {
    NodeHandle handle;
    NodeKind kind = NodeKind::Empty;
    std::string name;
    Pose3 pose;
    NodeHandle parent;  // INVALID_NODE when top-level
    std::vector<NodeHandle> children;

    // Mesh
    MeshData mesh;
    PrimitiveKind primitive = PrimitiveKind::Cylinder;
    PrimitiveParams params;
    std::optional<PrismProfile> prism;  // Set while the mesh is still an unmodified prism
    MaterialId material = MaterialId::None;
    bool smooth_shading = false;

    // Light
    LightDesc light;

    [[nodiscard]] bool is_mesh() const { return kind == NodeKind::Mesh; }
    [[nodiscard]] bool has_parent() const { return parent.valid(); }
};

struct SceneStats {
    size_t mesh_count = 0;
    size_t light_count = 0;
    size_t empty_count = 0;
    size_t vertex_count = 0;
    size_t triangle_count = 0;
};

class MemoryScene : public SceneHost {
public:
    MemoryScene();
    ~MemoryScene() override;

    // SceneHost
    [[nodiscard]] MeshHandle create_primitive(PrimitiveKind kind, const PrimitiveParams& params, const Pose3& pose,
                                              std::string_view name) override;
    MeshHandle boolean_difference(MeshHandle a, MeshHandle b) override;
    void bevel_edges(MeshHandle mesh, double width, uint32_t segments) override;
    [[nodiscard]] std::vector<Vec3> get_vertex_buffer(MeshHandle mesh) const override;
    void set_vertex_buffer(MeshHandle mesh, const std::vector<Vec3>& vertices) override;
    [[nodiscard]] NodeHandle create_light(const LightDesc& desc, const Pose3& pose, std::string_view name) override;
    [[nodiscard]] NodeHandle create_empty_anchor(const Pose3& pose, std::string_view name) override;
    void set_parent(NodeHandle child, NodeHandle parent) override;
    void tag_material(MeshHandle mesh, MaterialId material) override;
    void set_smooth_shading(MeshHandle mesh, bool smooth) override;
    void destroy(NodeHandle node) override;
    [[nodiscard]] bool exists(NodeHandle node) const override;
    [[nodiscard]] NodeKind kind_of(NodeHandle node) const override;
    [[nodiscard]] std::vector<NodeHandle> top_level_nodes() const override;
    [[nodiscard]] std::vector<MeshHandle> mesh_nodes() const override;
    [[nodiscard]] const char* get_backend_name() const override { return "memory"; }

    // ========================================================================
    // Inspection
    // ========================================================================

    // Throws HostOperationError for unknown handles
    [[nodiscard]] const SceneNode& node(NodeHandle handle) const;
    [[nodiscard]] const SceneNode* find(NodeHandle handle) const;
    [[nodiscard]] const SceneNode* find_by_name(std::string_view name) const;

    // All live nodes in creation order
    [[nodiscard]] std::vector<NodeHandle> all_nodes() const;
    [[nodiscard]] size_t node_count() const;

    // Local-to-world transform, walking up the parent chain
    [[nodiscard]] geometry::Mat4 world_transform(NodeHandle handle) const;

    // Number of nodes in the subtree below handle (excluding handle itself)
    [[nodiscard]] size_t descendant_count(NodeHandle handle) const;

    [[nodiscard]] SceneStats stats() const;

    void clear();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace hexforge::scene

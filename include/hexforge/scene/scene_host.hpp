// HexForge Scene
// scene_host.hpp - Host scene interface used by every builder

#pragma once

#include "material.hpp"
#include "types.hpp"

#include <string_view>
#include <vector>

namespace hexforge::scene {

// Abstract host scene. Every operation addresses objects through explicit handles;
// there is no "current selection" or "active object" state.
// Implementations: MemoryScene
class SceneHost {
public:
    virtual ~SceneHost() = default;

    // Non-copyable, non-movable
    SceneHost(const SceneHost&) = delete;
    SceneHost& operator=(const SceneHost&) = delete;
    SceneHost(SceneHost&&) = delete;
    SceneHost& operator=(SceneHost&&) = delete;

    // ========================================================================
    // Mesh Creation
    // ========================================================================

    [[nodiscard]] virtual MeshHandle create_primitive(PrimitiveKind kind, const PrimitiveParams& params,
                                                      const Pose3& pose, std::string_view name) = 0;

    // ========================================================================
    // Mesh Editing
    // ========================================================================

    // Subtracts b from a in place and returns a. b is left untouched; the caller
    // still owns it and must destroy it.
    virtual MeshHandle boolean_difference(MeshHandle a, MeshHandle b) = 0;

    // Rounds the cap rims of a prism
    virtual void bevel_edges(MeshHandle mesh, double width, uint32_t segments) = 0;

    // Vertex positions in the mesh's local frame
    [[nodiscard]] virtual std::vector<Vec3> get_vertex_buffer(MeshHandle mesh) const = 0;

    // Replaces vertex positions; the count must match the current buffer
    virtual void set_vertex_buffer(MeshHandle mesh, const std::vector<Vec3>& vertices) = 0;

    // ========================================================================
    // Non-mesh Nodes
    // ========================================================================

    [[nodiscard]] virtual NodeHandle create_light(const LightDesc& desc, const Pose3& pose, std::string_view name) = 0;
    [[nodiscard]] virtual NodeHandle create_empty_anchor(const Pose3& pose, std::string_view name) = 0;

    // ========================================================================
    // Hierarchy and Tagging
    // ========================================================================

    // The child's pose becomes relative to the parent. A node is parented at most once.
    virtual void set_parent(NodeHandle child, NodeHandle parent) = 0;
    virtual void tag_material(MeshHandle mesh, MaterialId material) = 0;
    virtual void set_smooth_shading(MeshHandle mesh, bool smooth) = 0;
    virtual void destroy(NodeHandle node) = 0;

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] virtual bool exists(NodeHandle node) const = 0;
    [[nodiscard]] virtual NodeKind kind_of(NodeHandle node) const = 0;

    // Nodes without a parent, in creation order
    [[nodiscard]] virtual std::vector<NodeHandle> top_level_nodes() const = 0;

    // Every mesh node, in creation order
    [[nodiscard]] virtual std::vector<MeshHandle> mesh_nodes() const = 0;

    [[nodiscard]] virtual const char* get_backend_name() const = 0;

protected:
    SceneHost() = default;
};

// Destroys a temporary node when it goes out of scope (boolean cutters).
// release() hands ownership back to the caller.
class ScopedNode {
public:
    ScopedNode(SceneHost& host, NodeHandle node) : host_(host), node_(node) {}
    ~ScopedNode();

    ScopedNode(const ScopedNode&) = delete;
    ScopedNode& operator=(const ScopedNode&) = delete;

    [[nodiscard]] NodeHandle get() const { return node_; }
    NodeHandle release();

    // Destroys now and propagates host errors
    void reset();

private:
    SceneHost& host_;
    NodeHandle node_;
};

}  // namespace hexforge::scene

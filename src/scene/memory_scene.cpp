// HexForge Scene
// memory_scene.cpp - In-process scene host backed by a node table

#include <cmath>
#include <fmt/format.h>
#include <hexforge/core/errors.hpp>
#include <hexforge/core/logger.hpp>
#include <hexforge/scene/memory_scene.hpp>
#include <map>

namespace hexforge::scene {

namespace {

constexpr double POSE_TOLERANCE = 1e-9;

bool nearly_zero(double value) {
    return std::abs(value) <= POSE_TOLERANCE;
}

bool is_upright(const Pose3& pose) {
    return nearly_zero(pose.rotation.x) && nearly_zero(pose.rotation.y) && nearly_zero(pose.scale.x - 1.0) &&
           nearly_zero(pose.scale.y - 1.0) && nearly_zero(pose.scale.z - 1.0);
}

// True when a yaw difference maps a regular polygon with `sides` sides onto itself
bool is_symmetry_rotation(double yaw, uint32_t sides) {
    const double step = geometry::TWO_PI / static_cast<double>(sides);
    const double remainder = std::fmod(std::abs(yaw), step);
    return remainder <= 1e-9 || step - remainder <= 1e-9;
}

}  // namespace

struct MemoryScene::Impl {
    std::map<uint32_t, SceneNode> nodes;
    uint32_t next_id = 1;

    SceneNode& create(NodeKind kind, const Pose3& pose, std::string_view name) {
        NodeHandle handle{next_id++};
        SceneNode& node = nodes[handle.id];
        node.handle = handle;
        node.kind = kind;
        node.pose = pose;
        node.name = std::string(name);
        return node;
    }

    SceneNode& require(NodeHandle handle, const char* operation) {
        auto it = nodes.find(handle.id);
        if (it == nodes.end()) {
            throw core::HostOperationError(fmt::format("{}: unknown node handle {}", operation, handle.id));
        }
        return it->second;
    }

    const SceneNode& require(NodeHandle handle, const char* operation) const {
        auto it = nodes.find(handle.id);
        if (it == nodes.end()) {
            throw core::HostOperationError(fmt::format("{}: unknown node handle {}", operation, handle.id));
        }
        return it->second;
    }

    SceneNode& require_mesh(NodeHandle handle, const char* operation) {
        SceneNode& node = require(handle, operation);
        if (!node.is_mesh()) {
            throw core::HostOperationError(fmt::format("{}: node '{}' is not a mesh", operation, node.name));
        }
        return node;
    }

    const SceneNode& require_mesh(NodeHandle handle, const char* operation) const {
        const SceneNode& node = require(handle, operation);
        if (!node.is_mesh()) {
            throw core::HostOperationError(fmt::format("{}: node '{}' is not a mesh", operation, node.name));
        }
        return node;
    }

    void erase_subtree(NodeHandle handle) {
        auto it = nodes.find(handle.id);
        if (it == nodes.end()) {
            return;
        }
        const auto children = it->second.children;
        for (const auto& child : children) {
            erase_subtree(child);
        }
        nodes.erase(handle.id);
    }
};

MemoryScene::MemoryScene() : impl_(std::make_unique<Impl>()) {}

MemoryScene::~MemoryScene() = default;

// ============================================================================
// Mesh Creation
// ============================================================================

MeshHandle MemoryScene::create_primitive(PrimitiveKind kind, const PrimitiveParams& params, const Pose3& pose,
                                         std::string_view name) {
    MeshData mesh = PrimitiveMesh::build(kind, params);

    SceneNode& node = impl_->create(NodeKind::Mesh, pose, name);
    node.mesh = std::move(mesh);
    node.primitive = kind;
    node.params = params;
    if (kind == PrimitiveKind::Cylinder) {
        node.prism = PrismProfile{.sides = params.sides, .radius = params.radius1, .depth = params.depth};
    }

    HEXFORGE_LOG_TRACE(core::log_category::SCENE, "Created {} '{}' ({} vertices)", primitive_kind_name(kind),
                       node.name, node.mesh.vertex_count());
    return node.handle;
}

// ============================================================================
// Mesh Editing
// ============================================================================

MeshHandle MemoryScene::boolean_difference(MeshHandle a, MeshHandle b) {
    if (a == b) {
        throw core::HostOperationError("boolean_difference: a mesh cannot be subtracted from itself");
    }
    SceneNode& outer = impl_->require_mesh(a, "boolean_difference");
    const SceneNode& inner = impl_->require_mesh(b, "boolean_difference");

    if (!outer.prism || !inner.prism) {
        throw core::GeometryDegeneracyError(
            fmt::format("Boolean difference '{}' - '{}' needs two unmodified prisms", outer.name, inner.name));
    }
    if (outer.parent != inner.parent) {
        throw core::HostOperationError(
            fmt::format("Boolean difference '{}' - '{}' spans two coordinate frames", outer.name, inner.name));
    }
    if (!is_upright(outer.pose) || !is_upright(inner.pose)) {
        throw core::GeometryDegeneracyError(
            fmt::format("Boolean difference '{}' - '{}' needs upright unscaled prisms", outer.name, inner.name));
    }

    const Vec3 offset = inner.pose.position - outer.pose.position;
    if (!nearly_zero(offset.x) || !nearly_zero(offset.y)) {
        throw core::GeometryDegeneracyError(
            fmt::format("Boolean difference '{}' - '{}' needs coaxial prisms", outer.name, inner.name));
    }

    // The cutter must pass clean through both caps; coplanar faces are ambiguous
    const PrismProfile& outer_prism = *outer.prism;
    const PrismProfile& inner_prism = *inner.prism;
    const double outer_min = outer.pose.position.z - outer_prism.half_depth();
    const double outer_max = outer.pose.position.z + outer_prism.half_depth();
    const double inner_min = inner.pose.position.z - inner_prism.half_depth();
    const double inner_max = inner.pose.position.z + inner_prism.half_depth();
    if (!(inner_min < outer_min - POSE_TOLERANCE) || !(inner_max > outer_max + POSE_TOLERANCE)) {
        throw core::GeometryDegeneracyError(fmt::format(
            "Cutter '{}' spans z [{}, {}] but must strictly extend past '{}' z [{}, {}]", inner.name, inner_min,
            inner_max, outer.name, outer_min, outer_max));
    }

    const double relative_yaw = inner.pose.rotation.z - outer.pose.rotation.z;
    const bool similar = inner_prism.sides == outer_prism.sides && is_symmetry_rotation(relative_yaw, outer_prism.sides);
    const double limit = similar ? outer_prism.radius : outer_prism.apothem();
    if (!(inner_prism.radius < limit)) {
        throw core::GeometryDegeneracyError(fmt::format(
            "Cutter '{}' (radius {}) does not fit inside '{}' (limit {})", inner.name, inner_prism.radius, outer.name,
            limit));
    }

    outer.mesh = PrimitiveMesh::annulus(outer_prism, inner_prism, relative_yaw);
    outer.prism.reset();

    HEXFORGE_LOG_DEBUG(core::log_category::SCENE, "Carved '{}' with '{}' ({} triangles)", outer.name, inner.name,
                       outer.mesh.triangle_count());
    return a;
}

void MemoryScene::bevel_edges(MeshHandle mesh, double width, uint32_t segments) {
    SceneNode& node = impl_->require_mesh(mesh, "bevel_edges");
    if (!node.prism) {
        throw core::HostOperationError(fmt::format("bevel_edges: '{}' is not an unmodified prism", node.name));
    }

    const PrismProfile& prism = *node.prism;
    if (!(width > 0.0) || segments == 0 || width >= prism.half_depth() || width >= prism.apothem()) {
        throw core::GeometryDegeneracyError(fmt::format("Bevel width {} x {} segments is degenerate for '{}'",
                                                        width, segments, node.name));
    }

    node.mesh = PrimitiveMesh::beveled_prism(prism, width, segments);
    node.prism.reset();
}

std::vector<Vec3> MemoryScene::get_vertex_buffer(MeshHandle mesh) const {
    return impl_->require_mesh(mesh, "get_vertex_buffer").mesh.vertices;
}

void MemoryScene::set_vertex_buffer(MeshHandle mesh, const std::vector<Vec3>& vertices) {
    SceneNode& node = impl_->require_mesh(mesh, "set_vertex_buffer");
    if (vertices.size() != node.mesh.vertices.size()) {
        throw core::HostOperationError(fmt::format("set_vertex_buffer: '{}' has {} vertices, got {}", node.name,
                                                   node.mesh.vertices.size(), vertices.size()));
    }
    node.mesh.vertices = vertices;
    node.prism.reset();
}

// ============================================================================
// Non-mesh Nodes
// ============================================================================

NodeHandle MemoryScene::create_light(const LightDesc& desc, const Pose3& pose, std::string_view name) {
    SceneNode& node = impl_->create(NodeKind::Light, pose, name);
    node.light = desc;
    return node.handle;
}

NodeHandle MemoryScene::create_empty_anchor(const Pose3& pose, std::string_view name) {
    return impl_->create(NodeKind::Empty, pose, name).handle;
}

// ============================================================================
// Hierarchy and Tagging
// ============================================================================

void MemoryScene::set_parent(NodeHandle child, NodeHandle parent) {
    if (child == parent) {
        throw core::HostOperationError("set_parent: a node cannot be its own parent");
    }
    SceneNode& child_node = impl_->require(child, "set_parent");
    SceneNode& parent_node = impl_->require(parent, "set_parent");

    if (child_node.has_parent()) {
        throw core::HostOperationError(fmt::format("set_parent: '{}' is already parented", child_node.name));
    }
    for (NodeHandle ancestor = parent; ancestor.valid(); ancestor = impl_->require(ancestor, "set_parent").parent) {
        if (ancestor == child) {
            throw core::HostOperationError(
                fmt::format("set_parent: parenting '{}' under '{}' would form a cycle", child_node.name,
                            parent_node.name));
        }
    }

    child_node.parent = parent;
    parent_node.children.push_back(child);
}

void MemoryScene::tag_material(MeshHandle mesh, MaterialId material) {
    impl_->require_mesh(mesh, "tag_material").material = material;
}

void MemoryScene::set_smooth_shading(MeshHandle mesh, bool smooth) {
    impl_->require_mesh(mesh, "set_smooth_shading").smooth_shading = smooth;
}

void MemoryScene::destroy(NodeHandle node) {
    SceneNode& target = impl_->require(node, "destroy");
    if (target.has_parent()) {
        auto& siblings = impl_->require(target.parent, "destroy").children;
        std::erase(siblings, node);
    }
    impl_->erase_subtree(node);
}

// ============================================================================
// Queries
// ============================================================================

bool MemoryScene::exists(NodeHandle node) const {
    return impl_->nodes.contains(node.id);
}

NodeKind MemoryScene::kind_of(NodeHandle node) const {
    return impl_->require(node, "kind_of").kind;
}

std::vector<NodeHandle> MemoryScene::top_level_nodes() const {
    std::vector<NodeHandle> result;
    for (const auto& [id, node] : impl_->nodes) {
        if (!node.has_parent()) {
            result.push_back(node.handle);
        }
    }
    return result;
}

std::vector<MeshHandle> MemoryScene::mesh_nodes() const {
    std::vector<MeshHandle> result;
    for (const auto& [id, node] : impl_->nodes) {
        if (node.is_mesh()) {
            result.push_back(node.handle);
        }
    }
    return result;
}

const SceneNode& MemoryScene::node(NodeHandle handle) const {
    return impl_->require(handle, "node");
}

const SceneNode* MemoryScene::find(NodeHandle handle) const {
    auto it = impl_->nodes.find(handle.id);
    return it != impl_->nodes.end() ? &it->second : nullptr;
}

const SceneNode* MemoryScene::find_by_name(std::string_view name) const {
    for (const auto& [id, node] : impl_->nodes) {
        if (node.name == name) {
            return &node;
        }
    }
    return nullptr;
}

std::vector<NodeHandle> MemoryScene::all_nodes() const {
    std::vector<NodeHandle> result;
    result.reserve(impl_->nodes.size());
    for (const auto& [id, node] : impl_->nodes) {
        result.push_back(node.handle);
    }
    return result;
}

size_t MemoryScene::node_count() const {
    return impl_->nodes.size();
}

geometry::Mat4 MemoryScene::world_transform(NodeHandle handle) const {
    const SceneNode& node = impl_->require(handle, "world_transform");
    const geometry::Mat4 local = node.pose.to_matrix();
    return node.has_parent() ? world_transform(node.parent) * local : local;
}

size_t MemoryScene::descendant_count(NodeHandle handle) const {
    const SceneNode& node = impl_->require(handle, "descendant_count");
    size_t count = node.children.size();
    for (const auto& child : node.children) {
        count += descendant_count(child);
    }
    return count;
}

SceneStats MemoryScene::stats() const {
    SceneStats stats;
    for (const auto& [id, node] : impl_->nodes) {
        switch (node.kind) {
            case NodeKind::Mesh:
                ++stats.mesh_count;
                stats.vertex_count += node.mesh.vertex_count();
                stats.triangle_count += node.mesh.triangle_count();
                break;
            case NodeKind::Light:
                ++stats.light_count;
                break;
            case NodeKind::Empty:
                ++stats.empty_count;
                break;
        }
    }
    return stats;
}

void MemoryScene::clear() {
    // Ids keep counting so stale handles never alias new nodes
    impl_->nodes.clear();
}

}  // namespace hexforge::scene

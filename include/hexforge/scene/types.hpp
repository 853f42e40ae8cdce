// HexForge Scene
// types.hpp - Handles, primitive descriptions and node kinds of the host scene

#pragma once

#include <hexforge/geometry/types.hpp>

#include <cstdint>
#include <functional>

namespace hexforge::scene {

using geometry::MeshData;
using geometry::Pose3;
using geometry::Vec3;

// ============================================================================
// Handles
// ============================================================================

// Opaque reference to a host-owned node. Id 0 is never issued.
struct NodeHandle {
    uint32_t id = 0;

    [[nodiscard]] bool valid() const { return id != 0; }
    bool operator==(const NodeHandle&) const = default;
    auto operator<=>(const NodeHandle&) const = default;
};

// A node that carries mesh geometry. The builder that created it owns it until it
// is parented into the final hierarchy or destroyed.
using MeshHandle = NodeHandle;

inline constexpr NodeHandle INVALID_NODE{};

enum class NodeKind : uint8_t { Mesh, Light, Empty };

// ============================================================================
// Primitives
// ============================================================================

enum class PrimitiveKind : uint8_t { Cylinder, Cone, Icosphere, UvSphere, Plane };

[[nodiscard]] const char* primitive_kind_name(PrimitiveKind kind);

// Parameters of a single convex primitive. Which fields matter depends on the kind:
//   Cylinder  sides, radius1, depth
//   Cone      sides, radius1 (bottom), radius2 (top, 0 = apex), depth
//   Icosphere subdivisions, radius1
//   UvSphere  sides (segments), rings, radius1
//   Plane     size, subdivisions (cuts per side)
// Every primitive is centered on its local origin; cylinder and cone caps sit at
// z = +-depth/2 and their first ring vertex lies on +X.
struct PrimitiveParams {
    uint32_t sides = 32;
    uint32_t rings = 16;
    uint32_t subdivisions = 2;
    double radius1 = 1.0;
    double radius2 = 1.0;
    double depth = 2.0;
    double size = 2.0;

    [[nodiscard]] static PrimitiveParams cylinder(uint32_t sides, double radius, double depth) {
        return {.sides = sides, .radius1 = radius, .radius2 = radius, .depth = depth};
    }

    [[nodiscard]] static PrimitiveParams cone(uint32_t sides, double bottom_radius, double top_radius,
                                              double depth) {
        return {.sides = sides, .radius1 = bottom_radius, .radius2 = top_radius, .depth = depth};
    }

    [[nodiscard]] static PrimitiveParams icosphere(uint32_t subdivisions, double radius) {
        return {.subdivisions = subdivisions, .radius1 = radius, .radius2 = radius};
    }

    [[nodiscard]] static PrimitiveParams uv_sphere(uint32_t segments, uint32_t rings, double radius) {
        return {.sides = segments, .rings = rings, .radius1 = radius, .radius2 = radius};
    }

    [[nodiscard]] static PrimitiveParams plane(double size, uint32_t cuts = 0) {
        return {.subdivisions = cuts, .size = size};
    }

    bool operator==(const PrimitiveParams&) const = default;
};

// ============================================================================
// Lights
// ============================================================================

enum class LightKind : uint8_t { Point, Spot, Sun };

struct LightDesc {
    LightKind kind = LightKind::Point;
    glm::dvec3 color{1.0};
    double intensity = 10.0;  // Watts, as authored in the DCC
    double radius = 0.1;      // Soft shadow radius
};

}  // namespace hexforge::scene

template<>
struct std::hash<hexforge::scene::NodeHandle> {
    size_t operator()(const hexforge::scene::NodeHandle& handle) const noexcept {
        return std::hash<uint32_t>{}(handle.id);
    }
};

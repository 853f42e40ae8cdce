// HexForge Scene
// primitive_mesh.hpp - Triangle meshes for the convex primitive kinds

#pragma once

#include "types.hpp"

#include <cstdint>

namespace hexforge::scene {

// Prism dimensions recovered from a cylinder primitive. Used by the boolean and
// bevel kernels, which only operate on untouched straight prisms.
struct PrismProfile {
    uint32_t sides = 0;
    double radius = 0.0;  // Circumradius
    double depth = 0.0;

    [[nodiscard]] double half_depth() const { return depth * 0.5; }
    [[nodiscard]] double apothem() const;
};

// Mesh generation in the primitive's local frame. Invalid parameters raise
// HostOperationError; callers that want a ParameterError validate first.
class PrimitiveMesh {
public:
    [[nodiscard]] static MeshData build(PrimitiveKind kind, const PrimitiveParams& params);

    // Cylinder or truncated cone with fan-triangulated caps. A zero radius
    // collapses that end into a single apex vertex.
    [[nodiscard]] static MeshData cone(uint32_t sides, double bottom_radius, double top_radius, double depth);

    // Subdivided icosahedron projected onto the sphere
    [[nodiscard]] static MeshData icosphere(uint32_t subdivisions, double radius);

    // Latitude/longitude sphere with single pole vertices
    [[nodiscard]] static MeshData uv_sphere(uint32_t segments, uint32_t rings, double radius);

    // Square in the XY plane facing +Z, split by `cuts` interior lines per side
    [[nodiscard]] static MeshData plane(double size, uint32_t cuts);

    // Prism whose two cap rims are rounded with a quarter-circle profile of the
    // given width, sampled with `segments` steps per rim.
    [[nodiscard]] static MeshData beveled_prism(const PrismProfile& prism, double width, uint32_t segments);

    // Hollow prism: outer minus a coaxial inner prism through the full height.
    // Cap triangles zip the two loops together by angle, so the side counts and
    // the relative yaw of the loops may differ.
    [[nodiscard]] static MeshData annulus(const PrismProfile& outer, const PrismProfile& inner, double inner_yaw);

    // Subdivision levels at or above this are rejected (20 * 4^7 triangles)
    static constexpr uint32_t MAX_ICOSPHERE_SUBDIVISIONS = 7;

private:
    PrimitiveMesh() = delete;
};

}  // namespace hexforge::scene

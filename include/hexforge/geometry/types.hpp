// HexForge Geometry
// types.hpp - Points, poses and raw mesh buffers shared by every generator

#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

#include <cstdint>
#include <random>
#include <vector>

namespace hexforge::geometry {

// ============================================================================
// Scalar Types
// ============================================================================

// Layout and mesh math is done in double precision; the exporter narrows to float.
using Point2 = glm::dvec2;
using Vec3 = glm::dvec3;
using Mat4 = glm::dmat4;

// Pseudorandom generator threaded explicitly through scatter placement and jitter
using RandomEngine = std::mt19937;

inline constexpr double PI = 3.14159265358979323846;
inline constexpr double TWO_PI = 2.0 * PI;
inline constexpr double HALF_PI = 0.5 * PI;

// Rotating a hexagon by pi/6 puts an edge midpoint (not a vertex) on +X.
// Floor, hexagonal rings, altar tiers and edge spikes all share this offset.
inline constexpr double HEX_ORIENTATION_OFFSET = PI / 6.0;

// ============================================================================
// Pose
// ============================================================================

// Placement of a primitive: translation, XYZ Euler rotation (radians) and scale.
// Rotation order matches the usual DCC convention: R = Rz * Ry * Rx.
struct Pose3 {
    Vec3 position{0.0};
    Vec3 rotation{0.0};
    Vec3 scale{1.0};

    [[nodiscard]] static Pose3 at(const Vec3& position) { return Pose3{position, Vec3(0.0), Vec3(1.0)}; }

    [[nodiscard]] static Pose3 at(const Vec3& position, double yaw) {
        return Pose3{position, Vec3(0.0, 0.0, yaw), Vec3(1.0)};
    }

    [[nodiscard]] Mat4 to_matrix() const {
        Mat4 m = glm::translate(Mat4(1.0), position);
        m = glm::rotate(m, rotation.z, Vec3(0.0, 0.0, 1.0));
        m = glm::rotate(m, rotation.y, Vec3(0.0, 1.0, 0.0));
        m = glm::rotate(m, rotation.x, Vec3(1.0, 0.0, 0.0));
        return glm::scale(m, scale);
    }

    bool operator==(const Pose3&) const = default;
};

// ============================================================================
// Mesh Buffers
// ============================================================================

// Indexed triangle list in the mesh's local frame
struct MeshData {
    std::vector<Vec3> vertices;
    std::vector<uint32_t> indices;

    [[nodiscard]] size_t vertex_count() const { return vertices.size(); }
    [[nodiscard]] size_t triangle_count() const { return indices.size() / 3; }
    [[nodiscard]] bool empty() const { return vertices.empty() || indices.empty(); }

    void add_triangle(uint32_t a, uint32_t b, uint32_t c) {
        indices.push_back(a);
        indices.push_back(b);
        indices.push_back(c);
    }

    uint32_t add_vertex(const Vec3& v) {
        vertices.push_back(v);
        return static_cast<uint32_t>(vertices.size() - 1);
    }

    bool operator==(const MeshData&) const = default;
};

// Axis-aligned bounds of a vertex set (min > max when empty)
struct Bounds3 {
    Vec3 min{1e300};
    Vec3 max{-1e300};

    void expand(const Vec3& p) {
        min = glm::min(min, p);
        max = glm::max(max, p);
    }

    [[nodiscard]] bool valid() const { return min.x <= max.x && min.y <= max.y && min.z <= max.z; }
    [[nodiscard]] Vec3 size() const { return valid() ? max - min : Vec3(0.0); }
};

[[nodiscard]] inline Bounds3 compute_bounds(const std::vector<Vec3>& vertices) {
    Bounds3 bounds;
    for (const auto& v : vertices) {
        bounds.expand(v);
    }
    return bounds;
}

}  // namespace hexforge::geometry

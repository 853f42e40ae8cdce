// HexForge Generation
// deformation_ops.hpp - Vertex-buffer deformations applied before attachment

#pragma once

#include <hexforge/scene/scene_host.hpp>

#include <vector>

namespace hexforge::generation {

using geometry::RandomEngine;
using geometry::Vec3;
using scene::MeshHandle;

enum class Axis : uint8_t { X = 0, Y = 1, Z = 2 };

// Each operation exists twice: on a raw vertex list, and on a host mesh
// (read buffer, deform, write back).
class DeformationOps {
public:
    // ========================================================================
    // Vertex Lists
    // ========================================================================

    /// Vertices with a positive coordinate along axis get their two other
    /// coordinates scaled by lerp(start_scale, end_scale, coord / total_height).
    static void taper(std::vector<Vec3>& vertices, Axis axis, double start_scale, double end_scale,
                      double total_height);

    static void elongate(std::vector<Vec3>& vertices, Axis axis, double factor);

    /// Adds U(-magnitude, magnitude) to every coordinate, drawn x, y, z per
    /// vertex in buffer order. magnitude 0 leaves the buffer untouched.
    static void jitter(std::vector<Vec3>& vertices, double magnitude, RandomEngine& rng);

    /// Per-axis magnitudes; an axis with magnitude 0 still consumes its draw,
    /// so the sequence stays aligned with the uniform form.
    static void jitter(std::vector<Vec3>& vertices, const Vec3& magnitude, RandomEngine& rng);

    // ========================================================================
    // Host Meshes
    // ========================================================================

    static void taper_along_axis(scene::SceneHost& host, MeshHandle mesh, Axis axis, double start_scale,
                                 double end_scale, double total_height);
    static void elongate_along_axis(scene::SceneHost& host, MeshHandle mesh, Axis axis, double factor);
    static void jitter(scene::SceneHost& host, MeshHandle mesh, double magnitude, RandomEngine& rng);
    static void jitter(scene::SceneHost& host, MeshHandle mesh, const Vec3& magnitude, RandomEngine& rng);

private:
    DeformationOps() = delete;
};

}  // namespace hexforge::generation

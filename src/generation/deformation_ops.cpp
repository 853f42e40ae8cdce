// HexForge Generation
// deformation_ops.cpp - Vertex-buffer deformations applied before attachment

#include <fmt/format.h>
#include <hexforge/core/errors.hpp>
#include <hexforge/generation/deformation_ops.hpp>
#include <random>

namespace hexforge::generation {

namespace {

int axis_index(Axis axis) {
    return static_cast<int>(axis);
}

}  // namespace

void DeformationOps::taper(std::vector<Vec3>& vertices, Axis axis, double start_scale, double end_scale,
                           double total_height) {
    if (!(total_height > 0.0)) {
        throw core::ParameterError(fmt::format("Taper height must be positive, got {}", total_height));
    }

    const int along = axis_index(axis);
    for (auto& v : vertices) {
        const double coord = v[along];
        if (coord <= 0.0) {
            continue;
        }
        const double t = coord / total_height;
        const double scale = start_scale + (end_scale - start_scale) * t;
        for (int i = 0; i < 3; ++i) {
            if (i != along) {
                v[i] *= scale;
            }
        }
    }
}

void DeformationOps::elongate(std::vector<Vec3>& vertices, Axis axis, double factor) {
    const int along = axis_index(axis);
    for (auto& v : vertices) {
        v[along] *= factor;
    }
}

void DeformationOps::jitter(std::vector<Vec3>& vertices, double magnitude, RandomEngine& rng) {
    jitter(vertices, Vec3(magnitude), rng);
}

void DeformationOps::jitter(std::vector<Vec3>& vertices, const Vec3& magnitude, RandomEngine& rng) {
    if (magnitude == Vec3(0.0)) {
        return;
    }
    if (magnitude.x < 0.0 || magnitude.y < 0.0 || magnitude.z < 0.0) {
        throw core::ParameterError(fmt::format("Jitter magnitude must not be negative, got ({}, {}, {})",
                                               magnitude.x, magnitude.y, magnitude.z));
    }

    std::uniform_real_distribution<double> offset_x(-magnitude.x, magnitude.x);
    std::uniform_real_distribution<double> offset_y(-magnitude.y, magnitude.y);
    std::uniform_real_distribution<double> offset_z(-magnitude.z, magnitude.z);
    for (auto& v : vertices) {
        const double dx = offset_x(rng);
        const double dy = offset_y(rng);
        const double dz = offset_z(rng);
        v += Vec3(dx, dy, dz);
    }
}

void DeformationOps::taper_along_axis(scene::SceneHost& host, MeshHandle mesh, Axis axis, double start_scale,
                                      double end_scale, double total_height) {
    auto vertices = host.get_vertex_buffer(mesh);
    taper(vertices, axis, start_scale, end_scale, total_height);
    host.set_vertex_buffer(mesh, vertices);
}

void DeformationOps::elongate_along_axis(scene::SceneHost& host, MeshHandle mesh, Axis axis, double factor) {
    auto vertices = host.get_vertex_buffer(mesh);
    elongate(vertices, axis, factor);
    host.set_vertex_buffer(mesh, vertices);
}

void DeformationOps::jitter(scene::SceneHost& host, MeshHandle mesh, double magnitude, RandomEngine& rng) {
    jitter(host, mesh, Vec3(magnitude), rng);
}

void DeformationOps::jitter(scene::SceneHost& host, MeshHandle mesh, const Vec3& magnitude, RandomEngine& rng) {
    if (magnitude == Vec3(0.0)) {
        return;
    }
    auto vertices = host.get_vertex_buffer(mesh);
    jitter(vertices, magnitude, rng);
    host.set_vertex_buffer(mesh, vertices);
}

}  // namespace hexforge::generation

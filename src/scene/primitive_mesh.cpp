// HexForge Scene
// primitive_mesh.cpp - Triangle meshes for the convex primitive kinds

#include <algorithm>
#include <array>
#include <cmath>
#include <fmt/format.h>
#include <hexforge/core/errors.hpp>
#include <hexforge/scene/primitive_mesh.hpp>
#include <map>
#include <utility>

namespace hexforge::scene {

using geometry::PI;
using geometry::TWO_PI;

namespace {

[[noreturn]] void fail(const std::string& message) {
    throw core::HostOperationError(message);
}

// One horizontal loop of a prism or cone at height z
std::vector<uint32_t> add_ring(MeshData& mesh, uint32_t sides, double radius, double z, double yaw = 0.0) {
    std::vector<uint32_t> ring;
    ring.reserve(sides);
    for (uint32_t i = 0; i < sides; ++i) {
        const double angle = TWO_PI * static_cast<double>(i) / static_cast<double>(sides) + yaw;
        ring.push_back(mesh.add_vertex(Vec3(radius * std::cos(angle), radius * std::sin(angle), z)));
    }
    return ring;
}

// Quads between a lower and an upper loop with the same vertex count.
// outward = false flips the winding for walls that face the axis.
void stitch_rings(MeshData& mesh, const std::vector<uint32_t>& lower, const std::vector<uint32_t>& upper,
                  bool outward = true) {
    const size_t n = lower.size();
    for (size_t i = 0; i < n; ++i) {
        const size_t next = (i + 1) % n;
        if (outward) {
            mesh.add_triangle(lower[i], lower[next], upper[next]);
            mesh.add_triangle(lower[i], upper[next], upper[i]);
        } else {
            mesh.add_triangle(lower[i], upper[next], lower[next]);
            mesh.add_triangle(lower[i], upper[i], upper[next]);
        }
    }
}

// Fan around the loop's first vertex; up = true faces +Z
void fan_cap(MeshData& mesh, const std::vector<uint32_t>& ring, bool up) {
    for (size_t i = 1; i + 1 < ring.size(); ++i) {
        if (up) {
            mesh.add_triangle(ring[0], ring[i], ring[i + 1]);
        } else {
            mesh.add_triangle(ring[0], ring[i + 1], ring[i]);
        }
    }
}

double normalized_angle(double angle) {
    double a = std::fmod(angle, TWO_PI);
    if (a < 0.0) {
        a += TWO_PI;
    }
    return a;
}

// Triangulates the flat band between two concentric convex loops by walking both
// loops in angular order. Loop vertices must be ordered counter-clockwise and the
// outer loop's first vertex sits at angle 0.
void zip_loops(MeshData& mesh, const std::vector<uint32_t>& outer, const std::vector<double>& outer_angles,
               const std::vector<uint32_t>& inner, const std::vector<double>& inner_angles, bool up) {
    const size_t n_outer = outer.size();
    const size_t n_inner = inner.size();

    // Start the inner walk at its smallest normalized angle
    size_t inner_start = 0;
    for (size_t j = 1; j < n_inner; ++j) {
        if (inner_angles[j] < inner_angles[inner_start]) {
            inner_start = j;
        }
    }

    auto outer_angle = [&](size_t step) {
        return step < n_outer ? outer_angles[step] : outer_angles[step - n_outer] + TWO_PI;
    };
    auto inner_angle = [&](size_t step) {
        const size_t index = (inner_start + step) % n_inner;
        const double base = inner_angles[index];
        return step < n_inner ? (index < inner_start ? base + TWO_PI : base) : inner_angles[inner_start] + TWO_PI;
    };
    auto outer_vertex = [&](size_t step) { return outer[step % n_outer]; };
    auto inner_vertex = [&](size_t step) { return inner[(inner_start + step) % n_inner]; };

    size_t i = 0;
    size_t m = 0;
    while (i < n_outer || m < n_inner) {
        const bool advance_outer = (m == n_inner) || (i < n_outer && outer_angle(i + 1) <= inner_angle(m + 1));
        uint32_t a = outer_vertex(i);
        uint32_t b = 0;
        uint32_t c = 0;
        if (advance_outer) {
            b = outer_vertex(i + 1);
            c = inner_vertex(m);
            ++i;
        } else {
            b = inner_vertex(m + 1);
            c = inner_vertex(m);
            ++m;
        }
        if (up) {
            mesh.add_triangle(a, b, c);
        } else {
            mesh.add_triangle(a, c, b);
        }
    }
}

void validate_prism(const PrismProfile& prism, const char* what) {
    if (prism.sides < 3) {
        fail(fmt::format("{} prism needs at least 3 sides, got {}", what, prism.sides));
    }
    if (!(prism.radius > 0.0) || !(prism.depth > 0.0)) {
        fail(fmt::format("{} prism needs positive radius and depth (radius={}, depth={})", what, prism.radius,
                         prism.depth));
    }
}

}  // namespace

double PrismProfile::apothem() const {
    return radius * std::cos(PI / static_cast<double>(sides));
}

MeshData PrimitiveMesh::build(PrimitiveKind kind, const PrimitiveParams& params) {
    switch (kind) {
        case PrimitiveKind::Cylinder:
            return cone(params.sides, params.radius1, params.radius1, params.depth);
        case PrimitiveKind::Cone:
            return cone(params.sides, params.radius1, params.radius2, params.depth);
        case PrimitiveKind::Icosphere:
            return icosphere(params.subdivisions, params.radius1);
        case PrimitiveKind::UvSphere:
            return uv_sphere(params.sides, params.rings, params.radius1);
        case PrimitiveKind::Plane:
            return plane(params.size, params.subdivisions);
    }
    fail(fmt::format("Unknown primitive kind {}", static_cast<int>(kind)));
}

MeshData PrimitiveMesh::cone(uint32_t sides, double bottom_radius, double top_radius, double depth) {
    if (sides < 3) {
        fail(fmt::format("Cone needs at least 3 sides, got {}", sides));
    }
    if (!(depth > 0.0) || bottom_radius < 0.0 || top_radius < 0.0 || (bottom_radius == 0.0 && top_radius == 0.0)) {
        fail(fmt::format("Invalid cone dimensions (r1={}, r2={}, depth={})", bottom_radius, top_radius, depth));
    }

    MeshData mesh;
    const double half = depth * 0.5;

    if (top_radius == 0.0) {
        auto bottom = add_ring(mesh, sides, bottom_radius, -half);
        const uint32_t apex = mesh.add_vertex(Vec3(0.0, 0.0, half));
        for (uint32_t i = 0; i < sides; ++i) {
            mesh.add_triangle(bottom[i], bottom[(i + 1) % sides], apex);
        }
        fan_cap(mesh, bottom, false);
        return mesh;
    }

    if (bottom_radius == 0.0) {
        const uint32_t apex = mesh.add_vertex(Vec3(0.0, 0.0, -half));
        auto top = add_ring(mesh, sides, top_radius, half);
        for (uint32_t i = 0; i < sides; ++i) {
            mesh.add_triangle(apex, top[(i + 1) % sides], top[i]);
        }
        fan_cap(mesh, top, true);
        return mesh;
    }

    auto bottom = add_ring(mesh, sides, bottom_radius, -half);
    auto top = add_ring(mesh, sides, top_radius, half);
    stitch_rings(mesh, bottom, top);
    fan_cap(mesh, bottom, false);
    fan_cap(mesh, top, true);
    return mesh;
}

MeshData PrimitiveMesh::icosphere(uint32_t subdivisions, double radius) {
    if (!(radius > 0.0)) {
        fail(fmt::format("Icosphere radius must be positive, got {}", radius));
    }
    if (subdivisions >= MAX_ICOSPHERE_SUBDIVISIONS) {
        fail(fmt::format("Icosphere subdivision level {} is too high", subdivisions));
    }

    const double t = (1.0 + std::sqrt(5.0)) * 0.5;
    MeshData mesh;
    const std::array<Vec3, 12> base = {
        Vec3(-1, t, 0), Vec3(1, t, 0), Vec3(-1, -t, 0), Vec3(1, -t, 0),
        Vec3(0, -1, t), Vec3(0, 1, t), Vec3(0, -1, -t), Vec3(0, 1, -t),
        Vec3(t, 0, -1), Vec3(t, 0, 1), Vec3(-t, 0, -1), Vec3(-t, 0, 1),
    };
    for (const auto& v : base) {
        mesh.add_vertex(glm::normalize(v) * radius);
    }

    mesh.indices = {0, 11, 5,  0, 5,  1, 0, 1, 7, 0, 7,  10, 0, 10, 11, 1, 5, 9, 5, 11,
                    4, 11, 10, 2, 10, 7, 6, 7, 1, 8, 3, 9,  4,  3, 4,  2, 3, 2, 6, 3,
                    6, 8,  3,  8, 9,  4, 9, 5, 2, 4, 11, 6,  2,  10, 8, 6, 7, 9, 8, 1};

    for (uint32_t level = 0; level < subdivisions; ++level) {
        std::map<std::pair<uint32_t, uint32_t>, uint32_t> midpoints;
        auto midpoint = [&](uint32_t a, uint32_t b) {
            const std::pair<uint32_t, uint32_t> key = std::minmax(a, b);
            auto it = midpoints.find(key);
            if (it != midpoints.end()) {
                return it->second;
            }
            const Vec3 mid = glm::normalize((mesh.vertices[a] + mesh.vertices[b]) * 0.5) * radius;
            const uint32_t index = mesh.add_vertex(mid);
            midpoints.emplace(key, index);
            return index;
        };

        std::vector<uint32_t> refined;
        refined.reserve(mesh.indices.size() * 4);
        for (size_t f = 0; f < mesh.indices.size(); f += 3) {
            const uint32_t a = mesh.indices[f];
            const uint32_t b = mesh.indices[f + 1];
            const uint32_t c = mesh.indices[f + 2];
            const uint32_t ab = midpoint(a, b);
            const uint32_t bc = midpoint(b, c);
            const uint32_t ca = midpoint(c, a);
            refined.insert(refined.end(), {a, ab, ca, b, bc, ab, c, ca, bc, ab, bc, ca});
        }
        mesh.indices = std::move(refined);
    }
    return mesh;
}

MeshData PrimitiveMesh::uv_sphere(uint32_t segments, uint32_t rings, double radius) {
    if (segments < 3 || rings < 2) {
        fail(fmt::format("UV sphere needs >= 3 segments and >= 2 rings, got {}x{}", segments, rings));
    }
    if (!(radius > 0.0)) {
        fail(fmt::format("UV sphere radius must be positive, got {}", radius));
    }

    MeshData mesh;
    const uint32_t north = mesh.add_vertex(Vec3(0.0, 0.0, radius));

    std::vector<std::vector<uint32_t>> latitudes;
    latitudes.reserve(rings - 1);
    for (uint32_t k = 1; k < rings; ++k) {
        const double phi = PI * static_cast<double>(k) / static_cast<double>(rings);
        latitudes.push_back(add_ring(mesh, segments, radius * std::sin(phi), radius * std::cos(phi)));
    }
    const uint32_t south = mesh.add_vertex(Vec3(0.0, 0.0, -radius));

    const auto& first = latitudes.front();
    for (uint32_t j = 0; j < segments; ++j) {
        mesh.add_triangle(north, first[j], first[(j + 1) % segments]);
    }
    for (size_t k = 0; k + 1 < latitudes.size(); ++k) {
        // Latitudes run north to south, so the upper loop comes first
        stitch_rings(mesh, latitudes[k + 1], latitudes[k]);
    }
    const auto& last = latitudes.back();
    for (uint32_t j = 0; j < segments; ++j) {
        mesh.add_triangle(south, last[(j + 1) % segments], last[j]);
    }
    return mesh;
}

MeshData PrimitiveMesh::plane(double size, uint32_t cuts) {
    if (!(size > 0.0)) {
        fail(fmt::format("Plane size must be positive, got {}", size));
    }

    MeshData mesh;
    const uint32_t per_side = cuts + 2;
    const double step = size / static_cast<double>(per_side - 1);
    const double half = size * 0.5;

    for (uint32_t row = 0; row < per_side; ++row) {
        for (uint32_t col = 0; col < per_side; ++col) {
            mesh.add_vertex(Vec3(-half + step * col, -half + step * row, 0.0));
        }
    }
    for (uint32_t row = 0; row + 1 < per_side; ++row) {
        for (uint32_t col = 0; col + 1 < per_side; ++col) {
            const uint32_t v00 = row * per_side + col;
            const uint32_t v10 = v00 + 1;
            const uint32_t v01 = v00 + per_side;
            const uint32_t v11 = v01 + 1;
            mesh.add_triangle(v00, v10, v11);
            mesh.add_triangle(v00, v11, v01);
        }
    }
    return mesh;
}

MeshData PrimitiveMesh::beveled_prism(const PrismProfile& prism, double width, uint32_t segments) {
    validate_prism(prism, "Beveled");
    if (segments == 0) {
        fail("Bevel needs at least one segment");
    }
    const double half = prism.half_depth();
    if (!(width > 0.0) || width >= half || width >= prism.apothem()) {
        fail(fmt::format("Bevel width {} does not fit a prism of radius {} and depth {}", width, prism.radius,
                         prism.depth));
    }

    // A horizontal inset d moves every side face inward by d, which shrinks the
    // circumradius by d / cos(pi / sides).
    const double inset_scale = 1.0 / std::cos(PI / static_cast<double>(prism.sides));

    MeshData mesh;
    std::vector<std::vector<uint32_t>> profile;
    profile.reserve(2 * (segments + 1));

    for (uint32_t k = 0; k <= segments; ++k) {
        const double theta = geometry::HALF_PI * static_cast<double>(k) / static_cast<double>(segments);
        const double inset = width * (1.0 - std::sin(theta));
        const double z = -half + width * (1.0 - std::cos(theta));
        profile.push_back(add_ring(mesh, prism.sides, prism.radius - inset * inset_scale, z));
    }
    for (uint32_t k = 0; k <= segments; ++k) {
        const double theta = geometry::HALF_PI * static_cast<double>(k) / static_cast<double>(segments);
        const double inset = width * (1.0 - std::cos(theta));
        const double z = half - width + width * std::sin(theta);
        profile.push_back(add_ring(mesh, prism.sides, prism.radius - inset * inset_scale, z));
    }

    for (size_t k = 0; k + 1 < profile.size(); ++k) {
        stitch_rings(mesh, profile[k], profile[k + 1]);
    }
    fan_cap(mesh, profile.front(), false);
    fan_cap(mesh, profile.back(), true);
    return mesh;
}

MeshData PrimitiveMesh::annulus(const PrismProfile& outer, const PrismProfile& inner, double inner_yaw) {
    validate_prism(outer, "Outer");
    validate_prism(inner, "Inner");

    MeshData mesh;
    const double half = outer.half_depth();

    auto loop_angles = [](uint32_t sides, double yaw) {
        std::vector<double> angles(sides);
        for (uint32_t i = 0; i < sides; ++i) {
            angles[i] = normalized_angle(TWO_PI * static_cast<double>(i) / static_cast<double>(sides) + yaw);
        }
        return angles;
    };
    const auto outer_angles = loop_angles(outer.sides, 0.0);
    const auto inner_angles = loop_angles(inner.sides, inner_yaw);

    auto outer_bottom = add_ring(mesh, outer.sides, outer.radius, -half);
    auto outer_top = add_ring(mesh, outer.sides, outer.radius, half);
    auto inner_bottom = add_ring(mesh, inner.sides, inner.radius, -half, inner_yaw);
    auto inner_top = add_ring(mesh, inner.sides, inner.radius, half, inner_yaw);

    stitch_rings(mesh, outer_bottom, outer_top);
    stitch_rings(mesh, inner_bottom, inner_top, false);
    zip_loops(mesh, outer_top, outer_angles, inner_top, inner_angles, true);
    zip_loops(mesh, outer_bottom, outer_angles, inner_bottom, inner_angles, false);
    return mesh;
}

const char* primitive_kind_name(PrimitiveKind kind) {
    switch (kind) {
        case PrimitiveKind::Cylinder:
            return "cylinder";
        case PrimitiveKind::Cone:
            return "cone";
        case PrimitiveKind::Icosphere:
            return "icosphere";
        case PrimitiveKind::UvSphere:
            return "uv_sphere";
        case PrimitiveKind::Plane:
            return "plane";
    }
    return "unknown";
}

}  // namespace hexforge::scene

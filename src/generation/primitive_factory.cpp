// HexForge Generation
// primitive_factory.cpp - Validated primitive creation on a scene host

#include <fmt/format.h>
#include <hexforge/core/errors.hpp>
#include <hexforge/generation/primitive_factory.hpp>
#include <hexforge/scene/primitive_mesh.hpp>

namespace hexforge::generation {

using scene::PrimitiveKind;
using scene::PrimitiveParams;

namespace {

[[noreturn]] void reject(PrimitiveKind kind, std::string_view reason) {
    throw core::ParameterError(fmt::format("Invalid {} parameters: {}", scene::primitive_kind_name(kind), reason));
}

}  // namespace

PrimitiveFactory::PrimitiveFactory(scene::SceneHost& host) : host_(host) {}

void PrimitiveFactory::validate(PrimitiveKind kind, const PrimitiveParams& params) {
    switch (kind) {
        case PrimitiveKind::Cylinder:
            if (params.sides < 3) {
                reject(kind, fmt::format("sides {} < 3", params.sides));
            }
            if (!(params.radius1 > 0.0) || !(params.depth > 0.0)) {
                reject(kind, fmt::format("radius {} and depth {} must be positive", params.radius1, params.depth));
            }
            break;
        case PrimitiveKind::Cone:
            if (params.sides < 3) {
                reject(kind, fmt::format("sides {} < 3", params.sides));
            }
            if (!(params.depth > 0.0) || params.radius1 < 0.0 || params.radius2 < 0.0 ||
                !(params.radius1 > 0.0 || params.radius2 > 0.0)) {
                reject(kind, fmt::format("radii {} / {} and depth {} are invalid", params.radius1, params.radius2,
                                         params.depth));
            }
            break;
        case PrimitiveKind::Icosphere:
            if (!(params.radius1 > 0.0)) {
                reject(kind, fmt::format("radius {} must be positive", params.radius1));
            }
            if (params.subdivisions >= scene::PrimitiveMesh::MAX_ICOSPHERE_SUBDIVISIONS) {
                reject(kind, fmt::format("subdivision level {} is too high", params.subdivisions));
            }
            break;
        case PrimitiveKind::UvSphere:
            if (params.sides < 3 || params.rings < 2) {
                reject(kind, fmt::format("{} segments x {} rings is too coarse", params.sides, params.rings));
            }
            if (!(params.radius1 > 0.0)) {
                reject(kind, fmt::format("radius {} must be positive", params.radius1));
            }
            break;
        case PrimitiveKind::Plane:
            if (!(params.size > 0.0)) {
                reject(kind, fmt::format("size {} must be positive", params.size));
            }
            break;
    }
}

MeshHandle PrimitiveFactory::create(PrimitiveKind kind, const PrimitiveParams& params, const Pose3& pose,
                                    std::string_view name) {
    validate(kind, params);
    MeshHandle mesh = host_.create_primitive(kind, params, pose, name);
    ++created_;
    return mesh;
}

MeshHandle PrimitiveFactory::cylinder(uint32_t sides, double radius, double depth, const Pose3& pose,
                                      std::string_view name) {
    return create(PrimitiveKind::Cylinder, PrimitiveParams::cylinder(sides, radius, depth), pose, name);
}

MeshHandle PrimitiveFactory::cone(uint32_t sides, double bottom_radius, double top_radius, double depth,
                                  const Pose3& pose, std::string_view name) {
    return create(PrimitiveKind::Cone, PrimitiveParams::cone(sides, bottom_radius, top_radius, depth), pose, name);
}

MeshHandle PrimitiveFactory::icosphere(uint32_t subdivisions, double radius, const Pose3& pose,
                                       std::string_view name) {
    return create(PrimitiveKind::Icosphere, PrimitiveParams::icosphere(subdivisions, radius), pose, name);
}

MeshHandle PrimitiveFactory::uv_sphere(uint32_t segments, uint32_t rings, double radius, const Pose3& pose,
                                       std::string_view name) {
    return create(PrimitiveKind::UvSphere, PrimitiveParams::uv_sphere(segments, rings, radius), pose, name);
}

MeshHandle PrimitiveFactory::plane(double size, uint32_t cuts, const Pose3& pose, std::string_view name) {
    return create(PrimitiveKind::Plane, PrimitiveParams::plane(size, cuts), pose, name);
}

}  // namespace hexforge::generation
